/**
 * @file rsa_keygen.h
 * @brief RSA Key Generation Module
 * 
 * Implements textbook RSA key pair generation:
 * - From two caller-chosen primes (the classroom workflow)
 * - From random primes of a small demonstration size
 * - Deterministic public exponent selection
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_CRYPTO_RSA_KEYGEN_H
#define TBRSA_CRYPTO_RSA_KEYGEN_H

#include "tbrsa/core/config.h"
#include "tbrsa/crypto/rsa/rsa_types.h"
#include "tbrsa/utils/random.h"
#include <cstddef>

namespace tbrsa {
namespace rsa {

/**
 * @brief Pick a public exponent coprime to phi
 * @param phi Euler's totient of the modulus
 * @return TBRSA_DEFAULT_PUBLIC_EXPONENT if it is below phi and coprime,
 *         otherwise the smallest odd e >= 3 with gcd(e, phi) == 1
 * @throws InvalidKeyError if no e with 1 < e < phi is coprime to phi
 */
ZZ select_public_exponent(const ZZ& phi);

/**
 * @brief Generate key pair from two primes
 * @param p First prime
 * @param q Second prime, distinct from p
 * @param e Public exponent, or 0 to select one with select_public_exponent()
 * @return Key pair with n = p*q and d = e^(-1) mod (p-1)(q-1)
 * 
 * @details
 * 1. Check p and q are distinct primes
 * 2. Compute n = p * q and phi(n) = (p-1)(q-1)
 * 3. Verify (or select) e with 1 < e < phi and gcd(e, phi) = 1
 * 4. Compute d = e^(-1) mod phi(n) by the extended Euclidean algorithm
 * 
 * @throws InvalidKeyError on equal or non-prime factors or an unusable e
 */
RSAKeyPair generate_keypair(const ZZ& p, const ZZ& q, const ZZ& e = ZZ(0));

/**
 * @brief Generate key pair from random primes
 * @param bits Modulus size within [2*TBRSA_MIN_PRIME_BITS, 2*TBRSA_MAX_PRIME_BITS]
 * @param e Public exponent (odd, > 1, below 2^(bits-2))
 * @param rng Random source
 * @return Key pair whose modulus has exactly @p bits bits
 * @throws InvalidKeyError on a bad size or exponent, or when no prime pair
 *         coprime to e turns up within TBRSA_KEYGEN_MAX_ATTEMPTS draws
 */
RSAKeyPair generate_random_keypair(size_t bits, const ZZ& e, Random& rng);

/**
 * @brief Same as above with a freshly seeded random source
 */
RSAKeyPair generate_random_keypair(size_t bits,
                                   const ZZ& e = ZZ(TBRSA_DEFAULT_PUBLIC_EXPONENT));

} // namespace rsa
} // namespace tbrsa

#endif // TBRSA_CRYPTO_RSA_KEYGEN_H
