/**
 * @file test_api.cpp
 * @brief C ABI unit tests
 *
 * Exercises the extern "C" entry points in tbrsa_api.h: error codes
 * are returned, never thrown.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <cstring>

#include "tbrsa/tbrsa_api.h"

TEST(ApiTest, Version) {
    EXPECT_STREQ(tbrsa_version(), TBRSA_VERSION_STRING);
    EXPECT_STRNE(tbrsa_platform(), "");
}

TEST(ApiTest, ErrorStrings) {
    EXPECT_STREQ(tbrsa_error_string(TBRSA_SUCCESS), "Success");
    EXPECT_STREQ(tbrsa_error_string(TBRSA_ERROR_INVALID_KEY), "Invalid key");
    EXPECT_STREQ(tbrsa_error_string(TBRSA_ERROR_NON_INVERTIBLE), "No modular inverse exists");
    EXPECT_STREQ(tbrsa_error_string(static_cast<tbrsa_error_t>(-99)), "Unknown error");
}

TEST(ApiTest, ModPow) {
    uint64_t r = 0;
    EXPECT_EQ(tbrsa_mod_pow_u64(65, 17, 3233, &r), TBRSA_SUCCESS);
    EXPECT_EQ(r, 2790u);

    // Operands near 2^64 must not overflow
    EXPECT_EQ(tbrsa_mod_pow_u64(UINT64_MAX - 1, 2, UINT64_MAX, &r), TBRSA_SUCCESS);
    EXPECT_EQ(r, 1u);

    EXPECT_EQ(tbrsa_mod_pow_u64(5, 3, 1, &r), TBRSA_SUCCESS);
    EXPECT_EQ(r, 0u);

    EXPECT_EQ(tbrsa_mod_pow_u64(2, 3, 0, &r), TBRSA_ERROR_INVALID_PARAM);
    EXPECT_EQ(tbrsa_mod_pow_u64(2, 3, 5, nullptr), TBRSA_ERROR_INVALID_PARAM);
}

TEST(ApiTest, ModInverse) {
    uint64_t r = 0;
    EXPECT_EQ(tbrsa_mod_inverse_u64(17, 3120, &r), TBRSA_SUCCESS);
    EXPECT_EQ(r, 2753u);

    EXPECT_EQ(tbrsa_mod_inverse_u64(6, 9, &r), TBRSA_ERROR_NON_INVERTIBLE);
    EXPECT_EQ(tbrsa_mod_inverse_u64(6, 0, &r), TBRSA_ERROR_INVALID_PARAM);
}

TEST(ApiTest, GenerateKeyPair) {
    uint64_t n = 0, e = 0, d = 0;
    EXPECT_EQ(tbrsa_generate_keypair_u64(61, 53, 17, &n, &e, &d), TBRSA_SUCCESS);
    EXPECT_EQ(n, 3233u);
    EXPECT_EQ(e, 17u);
    EXPECT_EQ(d, 2753u);

    EXPECT_EQ(tbrsa_generate_keypair_u64(61, 53, 0, &n, &e, &d), TBRSA_SUCCESS);
    EXPECT_EQ(e, 7u);
    EXPECT_EQ(d, 1783u);
}

TEST(ApiTest, GenerateKeyPair_Above32Bits) {
    // 4294967311 is the first prime above 2^32
    const uint64_t p = 4294967311ULL, q = 65537ULL;
    uint64_t n = 0, e = 0, d = 0;
    ASSERT_EQ(tbrsa_generate_keypair_u64(p, q, 0, &n, &e, &d), TBRSA_SUCCESS);
    EXPECT_EQ(n, p * q);
    EXPECT_EQ(e, 65537u);

    uint64_t c = 0, m = 0;
    ASSERT_EQ(tbrsa_mod_pow_u64(0x123456789ULL, e, n, &c), TBRSA_SUCCESS);
    ASSERT_EQ(tbrsa_mod_pow_u64(c, d, n, &m), TBRSA_SUCCESS);
    EXPECT_EQ(m, 0x123456789ULL);
}

TEST(ApiTest, GenerateKeyPair_Errors) {
    uint64_t n = 0, e = 0, d = 0;
    EXPECT_EQ(tbrsa_generate_keypair_u64(61, 61, 17, &n, &e, &d), TBRSA_ERROR_INVALID_KEY);
    EXPECT_EQ(tbrsa_generate_keypair_u64(62, 53, 17, &n, &e, &d), TBRSA_ERROR_INVALID_KEY);
    EXPECT_EQ(tbrsa_generate_keypair_u64(61, 53, 3, &n, &e, &d), TBRSA_ERROR_INVALID_KEY);
    EXPECT_EQ(tbrsa_generate_keypair_u64(61, 53, 17, nullptr, &e, &d), TBRSA_ERROR_INVALID_PARAM);

    // n = (2^61 - 1)(2^31 - 1) does not fit in 64 bits
    EXPECT_EQ(tbrsa_generate_keypair_u64(2305843009213693951ULL, 2147483647ULL, 0, &n, &e, &d),
              TBRSA_ERROR_INVALID_PARAM);
}
