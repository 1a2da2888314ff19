/**
 * @file arith.h
 * @brief Number-theoretic core: extended Euclid, modular inverse, modular power
 *
 * All routines work on arbitrary-precision GMP integers and are written out
 * step by step instead of calling mpz_powm/mpz_invert.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_MATH_ARITH_H
#define TBRSA_MATH_ARITH_H

#include <gmpxx.h>

namespace tbrsa {

/// Arbitrary-precision integer used throughout the library
using ZZ = mpz_class;

namespace math {

/**
 * @brief Result of the extended Euclidean algorithm
 *
 * Satisfies a*x + b*y == g with g == gcd(a, b) >= 0.
 */
struct ExtGCDResult {
    ZZ g;
    ZZ x;
    ZZ y;
};

/**
 * @brief Extended Euclidean algorithm (iterative)
 * @param a First operand (any sign)
 * @param b Second operand (any sign)
 * @return (g, x, y) with a*x + b*y == g, g non-negative
 */
ExtGCDResult extended_gcd(const ZZ& a, const ZZ& b);

/**
 * @brief Greatest common divisor, always non-negative
 */
ZZ gcd(const ZZ& a, const ZZ& b);

/**
 * @brief Modular multiplicative inverse
 * @param a Value to invert
 * @param m Modulus (m >= 1)
 * @return x in [0, m) with a*x == 1 (mod m)
 * @throws NonInvertibleError if m < 1 or gcd(a, m) != 1
 */
ZZ mod_inverse(const ZZ& a, const ZZ& m);

/**
 * @brief Modular exponentiation by repeated squaring
 * @param base Base (reduced into [0, modulus) first)
 * @param exponent Exponent (>= 0)
 * @param modulus Modulus (>= 1)
 * @return base^exponent mod modulus; 0 when modulus == 1
 * @throws std::invalid_argument for a negative exponent or modulus < 1
 */
ZZ mod_pow(const ZZ& base, const ZZ& exponent, const ZZ& modulus);

/**
 * @brief Non-negative residue of a modulo m (m >= 1)
 */
ZZ mod_floor(const ZZ& a, const ZZ& m);

} // namespace math
} // namespace tbrsa

#endif // TBRSA_MATH_ARITH_H
