/**
 * @file test_random.cpp
 * @brief Random source and secure wipe unit tests
 *
 * Tests for:
 * - tbrsa_random_bytes: OS random byte generation
 * - tbrsa::Random: seeded GMP generator, bit and range draws
 * - tbrsa_secure_zero / internal::wipe
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstring>
#include <set>

#include "tbrsa/core/security.h"
#include "tbrsa/utils/random.h"

using tbrsa::Random;

// ============================================================================
// OS Random Bytes
// ============================================================================

TEST(RandomTest, RandomBytes_Basic) {
    uint8_t buf1[32] = {0};
    uint8_t buf2[32] = {0};

    EXPECT_EQ(tbrsa_random_bytes(buf1, sizeof(buf1)), TBRSA_SUCCESS);
    EXPECT_EQ(tbrsa_random_bytes(buf2, sizeof(buf2)), TBRSA_SUCCESS);

    // Two calls should produce different output
    EXPECT_NE(memcmp(buf1, buf2, sizeof(buf1)), 0);
}

TEST(RandomTest, RandomBytes_InvalidParams) {
    EXPECT_EQ(tbrsa_random_bytes(nullptr, 16), TBRSA_ERROR_INVALID_PARAM);

    uint8_t buf[1] = {0xAA};
    EXPECT_EQ(tbrsa_random_bytes(buf, 0), TBRSA_SUCCESS);
    EXPECT_EQ(buf[0], 0xAA);
}

// ============================================================================
// GMP-backed Random
// ============================================================================

TEST(RandomTest, SeededIsReproducible) {
    Random a(1234), b(1234);
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(a.bits(100), b.bits(100));
    }

    a.seed(99);
    b.seed(99);
    EXPECT_EQ(a.range(0, 1000000), b.range(0, 1000000));
}

TEST(RandomTest, OsSeededInstancesDiffer) {
    Random a, b;
    EXPECT_NE(a.bits(256), b.bits(256));
}

TEST(RandomTest, BitsWithinWidth) {
    Random rng(7);
    EXPECT_EQ(rng.bits(0), 0);
    for (int i = 0; i < 100; i++) {
        mpz_class v = rng.bits(20);
        EXPECT_GE(v, 0);
        EXPECT_LT(v, 1 << 20);
    }
}

TEST(RandomTest, RangeInclusive) {
    Random rng(8);
    std::set<long> seen;
    for (int i = 0; i < 500; i++) {
        mpz_class v = rng.range(2, 6);
        ASSERT_GE(v, 2);
        ASSERT_LE(v, 6);
        seen.insert(v.get_si());
    }
    // All five values should show up in 500 draws
    EXPECT_EQ(seen.size(), 5u);

    EXPECT_EQ(rng.range(42, 42), 42);
    EXPECT_THROW(rng.range(5, 4), std::invalid_argument);
}

// ============================================================================
// Secure Wipe
// ============================================================================

TEST(RandomTest, SecureZero) {
    uint8_t buf[16];
    memset(buf, 0xFF, sizeof(buf));
    tbrsa_secure_zero(buf, sizeof(buf));
    for (uint8_t b : buf) {
        EXPECT_EQ(b, 0);
    }
    tbrsa_secure_zero(nullptr, 16);  // must not crash
}

TEST(RandomTest, WipeInteger) {
    mpz_class z("123456789012345678901234567890");
    tbrsa::internal::wipe(z);
    EXPECT_EQ(z, 0);
}
