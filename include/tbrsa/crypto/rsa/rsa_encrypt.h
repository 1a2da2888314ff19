/**
 * @file rsa_encrypt.h
 * @brief Textbook RSA encryption and decryption (no padding)
 *
 * Two message encodings are offered:
 * - Per character: every Unicode code point is encrypted on its own,
 *   producing one integer per character.
 * - Block: the whole UTF-8 message is read as one big-endian integer and
 *   encrypted once; the ciphertext is carried as Base64.
 *
 * Unpadded RSA is deterministic and malleable. It is shown here for
 * teaching only.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_CRYPTO_RSA_ENCRYPT_H
#define TBRSA_CRYPTO_RSA_ENCRYPT_H

#include "tbrsa/crypto/rsa/rsa_types.h"
#include <string>

namespace tbrsa {
namespace rsa {

// ============================================================================
// Integer Primitives
// ============================================================================

/**
 * @brief c = m^e mod n
 * @throws EncodingRangeError unless 0 <= m < n
 */
ZZ encrypt_int(const ZZ& m, const RSAPublicKey& pub);

/**
 * @brief m = c^d mod n
 * @throws EncodingRangeError unless 0 <= c < n
 */
ZZ decrypt_int(const ZZ& c, const RSAPrivateKey& priv);

// ============================================================================
// Per-Character Encryption
// ============================================================================

/**
 * @brief Encrypt each code point of a UTF-8 message
 * @param plaintext UTF-8 text
 * @param pub Public key
 * @return One ciphertext integer per code point
 * @throws EncodingRangeError if any code point is >= n (nothing is returned)
 * @throws encoding::EncodingError for malformed UTF-8
 */
Ciphertext encrypt(const std::string& plaintext, const RSAPublicKey& pub);

/**
 * @brief Decrypt a per-character ciphertext back to UTF-8
 * @throws EncodingRangeError if a value is outside [0, n) or does not
 *         decrypt to a Unicode scalar value
 */
std::string decrypt(const Ciphertext& ciphertext, const RSAPrivateKey& priv);

// ============================================================================
// Block Encryption
// ============================================================================

/**
 * @brief Encrypt the whole message as one integer
 * @return Base64 of the minimal big-endian ciphertext bytes
 * @throws EncodingRangeError if the message integer is >= n
 */
std::string encrypt_text(const std::string& plaintext, const RSAPublicKey& pub);

/**
 * @brief Decrypt a Base64 block ciphertext
 * @return Recovered UTF-8 text, or the decimal value of the recovered
 *         integer when its bytes are not valid UTF-8
 * @throws encoding::EncodingError for malformed Base64
 * @throws EncodingRangeError if the ciphertext integer is >= n
 */
std::string decrypt_text(const std::string& b64, const RSAPrivateKey& priv);

} // namespace rsa
} // namespace tbrsa

#endif // TBRSA_CRYPTO_RSA_ENCRYPT_H
