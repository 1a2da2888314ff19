/**
 * @file prime.cpp
 * @brief Miller-Rabin primality testing and prime generation
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "tbrsa/math/prime.h"
#include <array>
#include <stdexcept>
#include <string>

namespace tbrsa {
namespace math {

namespace {

const std::array<unsigned long, 25> SMALL_PRIMES = {
    2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37, 41, 43,
    47, 53, 59, 61, 67, 71, 73, 79, 83, 89, 97
};

// Bases 2..41 decide every n below this bound (Sorenson & Webster, 2015)
constexpr size_t FIXED_BASES = 13;
const ZZ DETERMINISTIC_BOUND("3317044064679887385961981");

/**
 * @brief One Miller-Rabin round: n - 1 = 2^r * d, d odd
 * @return false if @p a witnesses that n is composite
 */
bool miller_rabin_round(const ZZ& n, const ZZ& n_minus_1,
                        const ZZ& d, size_t r, const ZZ& a) {
    ZZ x = mod_pow(a, d, n);
    if (x == 1 || x == n_minus_1) return true;

    for (size_t j = 1; j < r; j++) {
        x = (x * x) % n;
        if (x == n_minus_1) return true;
        if (x == 1) return false;
    }
    return false;
}

bool random_rounds(const ZZ& n, const ZZ& n_minus_1, const ZZ& d, size_t r,
                   int rounds, Random& rng) {
    const ZZ hi = n - 2;
    for (int i = 0; i < rounds; i++) {
        // Pick random a in [2, n-2]
        ZZ a = rng.range(ZZ(2), hi);
        if (!miller_rabin_round(n, n_minus_1, d, r, a)) return false;
    }
    return true;
}

/**
 * @return 1 prime, 0 composite, -1 undecided by trial division
 */
int trial_division(const ZZ& n) {
    for (unsigned long p : SMALL_PRIMES) {
        if (n == p) return 1;
        if (mpz_divisible_ui_p(n.get_mpz_t(), p)) return 0;
    }
    // No factor below 100 and n < 100^2 means prime
    if (n < 10000) return 1;
    return -1;
}

bool is_probable_prime_impl(const ZZ& n, int rounds, Random* rng) {
    if (n < 2) return false;

    int td = trial_division(n);
    if (td >= 0) return td == 1;

    // Write n-1 = 2^r * d
    ZZ n_minus_1 = n - 1;
    ZZ d = n_minus_1;
    size_t r = 0;
    while (mpz_even_p(d.get_mpz_t())) {
        d >>= 1;
        r++;
    }

    for (size_t i = 0; i < FIXED_BASES; i++) {
        if (!miller_rabin_round(n, n_minus_1, d, r, ZZ(SMALL_PRIMES[i]))) {
            return false;
        }
    }

    if (n < DETERMINISTIC_BOUND || rounds <= 0) return true;

    if (rng != nullptr) {
        return random_rounds(n, n_minus_1, d, r, rounds, *rng);
    }
    Random local;
    return random_rounds(n, n_minus_1, d, r, rounds, local);
}

} // namespace

bool is_probable_prime(const ZZ& n, int rounds) {
    return is_probable_prime_impl(n, rounds, nullptr);
}

bool is_probable_prime(const ZZ& n, int rounds, Random& rng) {
    return is_probable_prime_impl(n, rounds, &rng);
}

ZZ random_prime(size_t bits, Random& rng) {
    if (bits < TBRSA_MIN_PRIME_BITS || bits > TBRSA_MAX_PRIME_BITS) {
        throw std::invalid_argument(
            "random_prime: bit length " + std::to_string(bits) +
            " outside [" + std::to_string(TBRSA_MIN_PRIME_BITS) + ", " +
            std::to_string(TBRSA_MAX_PRIME_BITS) + "]");
    }

    while (true) {
        ZZ candidate = rng.bits(bits);

        // Set top two bits (ensures bit length and product length)
        mpz_setbit(candidate.get_mpz_t(), bits - 1);
        mpz_setbit(candidate.get_mpz_t(), bits - 2);

        // Set bottom bit (ensure odd)
        mpz_setbit(candidate.get_mpz_t(), 0);

        while (mpz_sizeinbase(candidate.get_mpz_t(), 2) == bits) {
            if (is_probable_prime(candidate, TBRSA_MILLER_RABIN_ROUNDS, rng)) {
                return candidate;
            }
            candidate += 2;
        }
    }
}

} // namespace math
} // namespace tbrsa
