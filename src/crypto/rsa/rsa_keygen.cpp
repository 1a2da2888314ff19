/**
 * @file rsa_keygen.cpp
 * @brief RSA Key Generation Implementation
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "tbrsa/crypto/rsa/rsa_keygen.h"
#include "tbrsa/core/errors.h"
#include "tbrsa/core/security.h"
#include "tbrsa/math/prime.h"
#include <string>

namespace tbrsa {
namespace rsa {

namespace {

/**
 * @brief Steps 2-4 shared by both generators; p and q already checked
 */
RSAKeyPair assemble(const ZZ& p, const ZZ& q, const ZZ& e, const ZZ& phi) {
    RSAKeyPair kp;
    kp.p = p;
    kp.q = q;
    kp.n = p * q;
    kp.e = e;

    try {
        kp.d = math::mod_inverse(e, phi);
    } catch (const NonInvertibleError& ex) {
        throw InvalidKeyError(std::string("Public exponent has no inverse: ") + ex.what());
    }
    return kp;
}

} // namespace

// ============================================================================
// Public Exponent Selection
// ============================================================================

ZZ select_public_exponent(const ZZ& phi) {
    const ZZ preferred(TBRSA_DEFAULT_PUBLIC_EXPONENT);
    if (preferred < phi && math::gcd(preferred, phi) == 1) {
        return preferred;
    }

    // Smallest odd candidate; phi is even for odd primes, so even e never works
    for (ZZ e = 3; e < phi; e += 2) {
        if (math::gcd(e, phi) == 1) return e;
    }
    // phi == 2 (p, q = 2, 3) also admits no e in (1, phi)
    throw InvalidKeyError("No public exponent e with 1 < e < phi(n) = " +
                          phi.get_str() + " is coprime to phi(n)");
}

// ============================================================================
// RSA Key Generation
// ============================================================================

RSAKeyPair generate_keypair(const ZZ& p, const ZZ& q, const ZZ& e) {
    if (p == q) {
        throw InvalidKeyError("p and q must be distinct (both are " + p.get_str() + ")");
    }
    if (!math::is_probable_prime(p)) {
        throw InvalidKeyError("p = " + p.get_str() + " is not prime");
    }
    if (!math::is_probable_prime(q)) {
        throw InvalidKeyError("q = " + q.get_str() + " is not prime");
    }

    ZZ phi = (p - 1) * (q - 1);

    ZZ exponent;
    if (e == 0) {
        exponent = select_public_exponent(phi);
    } else {
        if (e <= 1 || e >= phi) {
            throw InvalidKeyError("Public exponent must satisfy 1 < e < phi(n) = " +
                                  phi.get_str() + ", got " + e.get_str());
        }
        if (math::gcd(e, phi) != 1) {
            throw InvalidKeyError("e = " + e.get_str() + " is not coprime to phi(n) = " +
                                  phi.get_str());
        }
        exponent = e;
    }

    RSAKeyPair kp = assemble(p, q, exponent, phi);
    internal::wipe(phi);
    return kp;
}

RSAKeyPair generate_random_keypair(size_t bits, const ZZ& e, Random& rng) {
    const size_t half = bits / 2;
    const size_t other = bits - half;
    if (half < TBRSA_MIN_PRIME_BITS || other > TBRSA_MAX_PRIME_BITS) {
        throw InvalidKeyError("Key size " + std::to_string(bits) + " bits outside [" +
                              std::to_string(2 * TBRSA_MIN_PRIME_BITS) + ", " +
                              std::to_string(2 * TBRSA_MAX_PRIME_BITS) + "]");
    }
    if (e <= 1 || mpz_even_p(e.get_mpz_t())) {
        throw InvalidKeyError("Public exponent must be odd and greater than 1");
    }
    // phi(n) > 2^(bits-2) for primes of this size, so this keeps e < phi
    if (mpz_sizeinbase(e.get_mpz_t(), 2) > bits - 2) {
        throw InvalidKeyError("Public exponent " + e.get_str() + " too large for a " +
                              std::to_string(bits) + "-bit modulus");
    }

    for (int attempt = 0; attempt < TBRSA_KEYGEN_MAX_ATTEMPTS; attempt++) {
        ZZ p = math::random_prime(half, rng);
        ZZ q = math::random_prime(other, rng);
        if (p == q) continue;

        ZZ phi = (p - 1) * (q - 1);
        if (e >= phi || math::gcd(e, phi) != 1) {
            internal::wipe(p);
            internal::wipe(q);
            internal::wipe(phi);
            continue;
        }

        RSAKeyPair kp = assemble(p, q, e, phi);
        internal::wipe(p);
        internal::wipe(q);
        internal::wipe(phi);
        return kp;
    }

    throw InvalidKeyError("e = " + e.get_str() + " not coprime to phi(n) after " +
                          std::to_string(TBRSA_KEYGEN_MAX_ATTEMPTS) +
                          " prime pairs; regenerate primes or choose a different e");
}

RSAKeyPair generate_random_keypair(size_t bits, const ZZ& e) {
    Random rng;
    return generate_random_keypair(bits, e, rng);
}

} // namespace rsa
} // namespace tbrsa
