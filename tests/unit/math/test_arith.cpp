/**
 * @file test_arith.cpp
 * @brief Modular arithmetic unit tests
 *
 * Tests for:
 * - extended_gcd: Bezout coefficients and sign normalization
 * - mod_pow: square-and-multiply edge cases
 * - mod_inverse: existence and NonInvertibleError
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <vector>

#include "tbrsa/core/errors.h"
#include "tbrsa/math/arith.h"

using tbrsa::ZZ;
using namespace tbrsa::math;

// ============================================================================
// Extended GCD
// ============================================================================

TEST(ArithTest, ExtendedGCD_BezoutIdentity) {
    const std::vector<std::pair<long, long>> cases = {
        {240, 46}, {17, 3120}, {3120, 17}, {1, 1}, {99, 78},
        {-12, 18}, {12, -18}, {-35, -15}, {0, 5}, {7, 0},
    };

    for (const auto& c : cases) {
        ZZ a(c.first), b(c.second);
        ExtGCDResult r = extended_gcd(a, b);
        EXPECT_EQ(ZZ(a * r.x + b * r.y), r.g) << "a=" << c.first << " b=" << c.second;
        EXPECT_GE(r.g, 0);
    }
}

TEST(ArithTest, ExtendedGCD_KnownValues) {
    EXPECT_EQ(extended_gcd(ZZ(240), ZZ(46)).g, 2);
    EXPECT_EQ(extended_gcd(ZZ(17), ZZ(3120)).g, 1);
    EXPECT_EQ(extended_gcd(ZZ(-12), ZZ(18)).g, 6);

    ExtGCDResult r = extended_gcd(ZZ(0), ZZ(5));
    EXPECT_EQ(r.g, 5);
    EXPECT_EQ(r.x, 0);
    EXPECT_EQ(r.y, 1);
}

TEST(ArithTest, ExtendedGCD_BothZero) {
    ExtGCDResult r = extended_gcd(ZZ(0), ZZ(0));
    EXPECT_EQ(r.g, 0);
    EXPECT_EQ(gcd(ZZ(0), ZZ(0)), 0);
}

TEST(ArithTest, ExtendedGCD_LargeOperands) {
    ZZ a("170141183460469231731687303715884105727");  // 2^127 - 1
    ZZ b("618970019642690137449562111");              // 2^89 - 1
    ExtGCDResult r = extended_gcd(a, b);
    EXPECT_EQ(r.g, 1);
    EXPECT_EQ(ZZ(a * r.x + b * r.y), 1);
}

// ============================================================================
// Modular Exponentiation
// ============================================================================

TEST(ArithTest, ModPow_KnownValues) {
    EXPECT_EQ(mod_pow(ZZ(2), ZZ(10), ZZ(1000)), 24);
    EXPECT_EQ(mod_pow(ZZ(4), ZZ(13), ZZ(497)), 445);
    EXPECT_EQ(mod_pow(ZZ(65), ZZ(17), ZZ(3233)), 2790);
    EXPECT_EQ(mod_pow(ZZ(2790), ZZ(2753), ZZ(3233)), 65);
}

TEST(ArithTest, ModPow_ZeroExponent) {
    EXPECT_EQ(mod_pow(ZZ(0), ZZ(0), ZZ(7)), 1);
    EXPECT_EQ(mod_pow(ZZ(123456), ZZ(0), ZZ(3233)), 1);
}

TEST(ArithTest, ModPow_ModulusOne) {
    EXPECT_EQ(mod_pow(ZZ(5), ZZ(3), ZZ(1)), 0);
    EXPECT_EQ(mod_pow(ZZ(5), ZZ(0), ZZ(1)), 0);
}

TEST(ArithTest, ModPow_NegativeBase) {
    // (-2)^3 = -8 == 6 (mod 7)
    EXPECT_EQ(mod_pow(ZZ(-2), ZZ(3), ZZ(7)), 6);
}

TEST(ArithTest, ModPow_MatchesGmp) {
    ZZ base("98765432109876543210");
    ZZ exp("1234567890123");
    ZZ mod("1000000000000000000000007");
    ZZ expected;
    mpz_powm(expected.get_mpz_t(), base.get_mpz_t(), exp.get_mpz_t(), mod.get_mpz_t());
    EXPECT_EQ(mod_pow(base, exp, mod), expected);
}

TEST(ArithTest, ModPow_InvalidArguments) {
    EXPECT_THROW(mod_pow(ZZ(2), ZZ(3), ZZ(0)), std::invalid_argument);
    EXPECT_THROW(mod_pow(ZZ(2), ZZ(3), ZZ(-5)), std::invalid_argument);
    EXPECT_THROW(mod_pow(ZZ(2), ZZ(-1), ZZ(7)), std::invalid_argument);
}

// ============================================================================
// Modular Inverse
// ============================================================================

TEST(ArithTest, ModInverse_KnownValues) {
    EXPECT_EQ(mod_inverse(ZZ(17), ZZ(3120)), 2753);
    EXPECT_EQ(mod_inverse(ZZ(3), ZZ(11)), 4);
    EXPECT_EQ(mod_inverse(ZZ(-3), ZZ(11)), 7);
    EXPECT_EQ(mod_inverse(ZZ(5), ZZ(1)), 0);
}

TEST(ArithTest, ModInverse_ResultInRange) {
    ZZ m(1000003);
    for (long a = 1; a < 200; a++) {
        ZZ inv = mod_inverse(ZZ(a), m);
        EXPECT_GE(inv, 0);
        EXPECT_LT(inv, m);
        EXPECT_EQ(mod_floor(ZZ(a * inv), m), 1);
    }
}

TEST(ArithTest, ModInverse_NotCoprime) {
    EXPECT_THROW(mod_inverse(ZZ(6), ZZ(9)), tbrsa::NonInvertibleError);
    EXPECT_THROW(mod_inverse(ZZ(0), ZZ(7)), tbrsa::NonInvertibleError);
    EXPECT_THROW(mod_inverse(ZZ(3), ZZ(0)), tbrsa::NonInvertibleError);

    try {
        mod_inverse(ZZ(3), ZZ(3120));
        FAIL() << "expected NonInvertibleError";
    } catch (const tbrsa::NonInvertibleError& e) {
        EXPECT_EQ(e.code(), TBRSA_ERROR_NON_INVERTIBLE);
    }
}

TEST(ArithTest, ModFloor) {
    EXPECT_EQ(mod_floor(ZZ(-7), ZZ(3)), 2);
    EXPECT_EQ(mod_floor(ZZ(7), ZZ(3)), 1);
    EXPECT_THROW(mod_floor(ZZ(7), ZZ(0)), std::invalid_argument);
}
