/**
 * @file rsa_encrypt.cpp
 * @brief Textbook RSA encryption and decryption implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "tbrsa/crypto/rsa/rsa_encrypt.h"
#include "tbrsa/core/errors.h"
#include "tbrsa/core/security.h"
#include "tbrsa/utils/encoding.h"

namespace tbrsa {
namespace rsa {

namespace {

void check_range(const ZZ& v, const ZZ& n, const char* what) {
    if (v < 0 || v >= n) {
        throw EncodingRangeError(std::string(what) + " must satisfy 0 <= value < n. Got value=" +
                                 v.get_str() + ", n=" + n.get_str());
    }
}

void check_key(bool valid) {
    if (!valid) {
        throw InvalidKeyError("Key is not usable (requires n > 1 and an exponent in range)");
    }
}

} // namespace

// ============================================================================
// Integer Primitives
// ============================================================================

ZZ encrypt_int(const ZZ& m, const RSAPublicKey& pub) {
    check_key(pub.is_valid());
    check_range(m, pub.n, "Plain integer");
    return math::mod_pow(m, pub.e, pub.n);
}

ZZ decrypt_int(const ZZ& c, const RSAPrivateKey& priv) {
    check_key(priv.is_valid());
    check_range(c, priv.n, "Cipher integer");
    return math::mod_pow(c, priv.d, priv.n);
}

// ============================================================================
// Per-Character Encryption
// ============================================================================

Ciphertext encrypt(const std::string& plaintext, const RSAPublicKey& pub) {
    check_key(pub.is_valid());
    CodePoints cps = encoding::utf8Decode(plaintext);

    // Reject up front so no partial ciphertext is ever produced
    for (size_t i = 0; i < cps.size(); i++) {
        if (pub.n <= static_cast<unsigned long>(cps[i])) {
            throw EncodingRangeError("Character code " +
                                     std::to_string(static_cast<unsigned long>(cps[i])) +
                                     " at position " + std::to_string(i) +
                                     " is not below n = " + pub.n.get_str() +
                                     "; use a larger key");
        }
    }

    Ciphertext out;
    out.reserve(cps.size());
    for (char32_t cp : cps) {
        out.push_back(math::mod_pow(ZZ(static_cast<unsigned long>(cp)), pub.e, pub.n));
    }
    return out;
}

std::string decrypt(const Ciphertext& ciphertext, const RSAPrivateKey& priv) {
    check_key(priv.is_valid());

    std::string out;
    out.reserve(ciphertext.size());
    for (size_t i = 0; i < ciphertext.size(); i++) {
        ZZ m = decrypt_int(ciphertext[i], priv);
        // Range check on the full integer before narrowing to char32_t
        if (m < 0 || m > 0x10FFFF ||
            !encoding::utf8Append(out, static_cast<char32_t>(m.get_ui()))) {
            std::string msg = "Value at position " + std::to_string(i) +
                              " decrypts to " + m.get_str() +
                              ", which is not a character code";
            internal::wipe(m);
            internal::secure_zero(&out[0], out.size());
            throw EncodingRangeError(msg);
        }
        internal::wipe(m);
    }
    return out;
}

// ============================================================================
// Block Encryption
// ============================================================================

std::string encrypt_text(const std::string& plaintext, const RSAPublicKey& pub) {
    check_key(pub.is_valid());
    ByteVec bytes(plaintext.begin(), plaintext.end());
    ZZ m = encoding::bytesToInteger(bytes);
    internal::secure_zero(bytes.data(), bytes.size());

    if (m >= pub.n) {
        internal::wipe(m);
        throw EncodingRangeError("Message integer representation too large for modulus n. "
                                 "Use larger key or shorter message.");
    }
    ZZ c = math::mod_pow(m, pub.e, pub.n);
    internal::wipe(m);

    ByteVec cbytes = encoding::integerToBytes(c);
    if (cbytes.empty()) cbytes.push_back(0x00);
    return encoding::base64Encode(cbytes);
}

std::string decrypt_text(const std::string& b64, const RSAPrivateKey& priv) {
    check_key(priv.is_valid());
    ZZ c = encoding::bytesToInteger(encoding::base64Decode(b64));
    ZZ m = decrypt_int(c, priv);

    ByteVec bytes = encoding::integerToBytes(m);
    std::string text(bytes.begin(), bytes.end());
    internal::secure_zero(bytes.data(), bytes.size());

    if (!encoding::isValidUtf8(text)) {
        return m.get_str();
    }
    return text;
}

} // namespace rsa
} // namespace tbrsa
