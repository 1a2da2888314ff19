/**
 * @file prime.h
 * @brief Primality testing and random prime generation
 * 
 * - Trial division by the primes below 100
 * - Miller-Rabin with a fixed base set (deterministic below 3.3e24)
 * - Extra random Miller-Rabin rounds for larger candidates
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_MATH_PRIME_H
#define TBRSA_MATH_PRIME_H

#include "tbrsa/core/config.h"
#include "tbrsa/math/arith.h"
#include "tbrsa/utils/random.h"
#include <cstddef>

namespace tbrsa {
namespace math {

/**
 * @brief Miller-Rabin primality test
 * @param n Candidate
 * @param rounds Random bases tried after the fixed set (only when n is
 *        beyond the deterministic bound)
 * @return true if n is (probably) prime
 */
bool is_probable_prime(const ZZ& n, int rounds = TBRSA_MILLER_RABIN_ROUNDS);

/**
 * @brief Same test, drawing the extra bases from @p rng
 */
bool is_probable_prime(const ZZ& n, int rounds, Random& rng);

/**
 * @brief Generate random prime of specified bit length
 * @param bits Exact bit length, within [TBRSA_MIN_PRIME_BITS, TBRSA_MAX_PRIME_BITS]
 * @param rng Random source
 * @return Prime with the top two bits set
 * @throws std::invalid_argument if bits is outside the window
 */
ZZ random_prime(size_t bits, Random& rng);

} // namespace math
} // namespace tbrsa

#endif // TBRSA_MATH_PRIME_H
