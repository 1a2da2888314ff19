/**
 * @file test_prime.cpp
 * @brief Primality testing and prime generation unit tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <vector>

#include "tbrsa/math/prime.h"

using tbrsa::ZZ;
using tbrsa::Random;
using namespace tbrsa::math;

// ============================================================================
// is_probable_prime
// ============================================================================

TEST(PrimeTest, SmallValues) {
    EXPECT_FALSE(is_probable_prime(ZZ(-7)));
    EXPECT_FALSE(is_probable_prime(ZZ(0)));
    EXPECT_FALSE(is_probable_prime(ZZ(1)));
    EXPECT_TRUE(is_probable_prime(ZZ(2)));
    EXPECT_TRUE(is_probable_prime(ZZ(3)));
    EXPECT_FALSE(is_probable_prime(ZZ(4)));
    EXPECT_TRUE(is_probable_prime(ZZ(53)));
    EXPECT_TRUE(is_probable_prime(ZZ(61)));
    EXPECT_FALSE(is_probable_prime(ZZ(62)));
    EXPECT_TRUE(is_probable_prime(ZZ(97)));
    EXPECT_TRUE(is_probable_prime(ZZ(101)));
    EXPECT_TRUE(is_probable_prime(ZZ(9973)));
    EXPECT_FALSE(is_probable_prime(ZZ(9999)));
    EXPECT_TRUE(is_probable_prime(ZZ(10007)));
}

TEST(PrimeTest, AgreesWithSieve) {
    const int limit = 20000;
    std::vector<bool> composite(limit, false);
    for (int i = 2; i * i < limit; i++) {
        if (!composite[i]) {
            for (int j = i * i; j < limit; j += i) composite[j] = true;
        }
    }
    for (int n = 2; n < limit; n++) {
        EXPECT_EQ(is_probable_prime(ZZ(n)), !composite[n]) << "n=" << n;
    }
}

TEST(PrimeTest, Pseudoprimes) {
    // Carmichael numbers
    EXPECT_FALSE(is_probable_prime(ZZ(561)));
    EXPECT_FALSE(is_probable_prime(ZZ(41041)));
    EXPECT_FALSE(is_probable_prime(ZZ(825265)));
    // Strong pseudoprime to bases 2, 3, 5 and 7
    EXPECT_FALSE(is_probable_prime(ZZ(3215031751UL)));
    // Strong pseudoprime to bases 2 through 37
    EXPECT_FALSE(is_probable_prime(ZZ("318665857834031151167461")));
}

TEST(PrimeTest, MersennePrimes) {
    EXPECT_TRUE(is_probable_prime(ZZ("2305843009213693951")));          // 2^61 - 1
    EXPECT_TRUE(is_probable_prime(ZZ("618970019642690137449562111")));  // 2^89 - 1
    EXPECT_FALSE(is_probable_prime(ZZ("618970019642690137449562113"))); // 2^89 + 1
}

TEST(PrimeTest, LargeSemiprime) {
    ZZ p("618970019642690137449562111");
    ZZ q("2305843009213693951");
    EXPECT_FALSE(is_probable_prime(p * q));
}

TEST(PrimeTest, ExplicitRandomSource) {
    Random rng(42);
    EXPECT_TRUE(is_probable_prime(ZZ("170141183460469231731687303715884105727"), 8, rng));
    EXPECT_FALSE(is_probable_prime(ZZ("170141183460469231731687303715884105729"), 8, rng));
}

// ============================================================================
// random_prime
// ============================================================================

TEST(PrimeTest, RandomPrime_ExactBitLength) {
    Random rng(12345);
    for (size_t bits : {8u, 16u, 31u, 64u, 128u}) {
        ZZ p = random_prime(bits, rng);
        EXPECT_EQ(mpz_sizeinbase(p.get_mpz_t(), 2), bits);
        EXPECT_TRUE(is_probable_prime(p));
        EXPECT_TRUE(mpz_tstbit(p.get_mpz_t(), bits - 2)) << "second-highest bit must be set";
    }
}

TEST(PrimeTest, RandomPrime_Reproducible) {
    Random a(7), b(7);
    EXPECT_EQ(random_prime(64, a), random_prime(64, b));
}

TEST(PrimeTest, RandomPrime_OutOfWindow) {
    Random rng(1);
    EXPECT_THROW(random_prime(TBRSA_MIN_PRIME_BITS - 1, rng), std::invalid_argument);
    EXPECT_THROW(random_prime(TBRSA_MAX_PRIME_BITS + 1, rng), std::invalid_argument);
}
