/**
 * @file rsa_types.h
 * @brief RSA Core Type Definitions
 *
 * Defines core RSA data structures:
 * - RSAPublicKey (n, e)
 * - RSAPrivateKey (n, d)
 * - RSAKeyPair (n, e, d and, when known, the factors p and q)
 * - Ciphertext
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_CRYPTO_RSA_TYPES_H
#define TBRSA_CRYPTO_RSA_TYPES_H

#include "tbrsa/math/arith.h"
#include <string>
#include <vector>

namespace tbrsa {
namespace rsa {

/// One encrypted integer per plaintext code point, each in [0, n)
using Ciphertext = std::vector<ZZ>;

// ============================================================================
// RSA Public Key
// ============================================================================

/**
 * @brief RSA Public Key
 */
struct RSAPublicKey {
    ZZ n;  ///< Modulus (n = p * q)
    ZZ e;  ///< Public exponent

    RSAPublicKey() = default;

    RSAPublicKey(const ZZ& n_, const ZZ& e_) : n(n_), e(e_) {}

    /**
     * @brief Validate key structure
     * @return true if n > 1 and 1 < e < n
     */
    bool is_valid() const {
        return n > 1 && e > 1 && e < n;
    }

    /**
     * @brief Modulus size in bits
     */
    size_t bits() const {
        return n > 0 ? mpz_sizeinbase(n.get_mpz_t(), 2) : 0;
    }

    std::string to_string() const;
};

// ============================================================================
// RSA Private Key
// ============================================================================

/**
 * @brief RSA Private Key (non-CRT)
 */
struct RSAPrivateKey {
    ZZ n;  ///< Modulus
    ZZ d;  ///< Private exponent

    RSAPrivateKey() = default;

    RSAPrivateKey(const ZZ& n_, const ZZ& d_) : n(n_), d(d_) {}

    RSAPrivateKey(const RSAPrivateKey&) = default;
    RSAPrivateKey& operator=(const RSAPrivateKey&) = default;

    bool is_valid() const {
        return n > 1 && d > 0 && d < n;
    }

    /**
     * @brief Securely zero the private exponent and modulus
     */
    void clear();

    ~RSAPrivateKey() {
        clear();
    }
};

// ============================================================================
// RSA Key Pair
// ============================================================================

/**
 * @brief RSA Key Pair
 *
 * p and q are zero when the pair was assembled from (n, e, d) alone.
 */
struct RSAKeyPair {
    ZZ n;  ///< Modulus
    ZZ e;  ///< Public exponent
    ZZ d;  ///< Private exponent, e*d == 1 (mod phi)
    ZZ p;  ///< First prime factor (optional)
    ZZ q;  ///< Second prime factor (optional)

    RSAKeyPair() = default;

    RSAKeyPair(const ZZ& n_, const ZZ& e_, const ZZ& d_)
        : n(n_), e(e_), d(d_) {}

    RSAKeyPair(const RSAKeyPair&) = default;
    RSAKeyPair& operator=(const RSAKeyPair&) = default;
    RSAKeyPair(RSAKeyPair&&) = default;
    RSAKeyPair& operator=(RSAKeyPair&&) = default;

    RSAPublicKey public_key() const { return RSAPublicKey(n, e); }
    RSAPrivateKey private_key() const { return RSAPrivateKey(n, d); }

    bool has_factors() const { return p > 0 && q > 0; }

    /**
     * @brief Euler's totient (p-1)(q-1); 0 when the factors are unknown
     */
    ZZ phi() const;

    /**
     * @brief Structural and, when the factors are known, arithmetic check
     *
     * Checks n > 1, 1 < e < n, 0 < d < n; with factors also n == p*q and
     * e*d == 1 (mod phi).
     */
    bool is_valid() const;

    /**
     * @brief Securely zero all components
     */
    void clear();

    ~RSAKeyPair() {
        clear();
    }
};

} // namespace rsa
} // namespace tbrsa

#endif // TBRSA_CRYPTO_RSA_TYPES_H
