/**
 * @file session.h
 * @brief Session context holding one key pair and the last ciphertexts
 *
 * A Session is created explicitly by the caller and passed to wherever it is
 * needed; the library keeps no global key state. Destroying or clearing a
 * session wipes its private material.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_SESSION_H
#define TBRSA_SESSION_H

#include "tbrsa/core/config.h"
#include "tbrsa/crypto/rsa/rsa_types.h"
#include "tbrsa/utils/random.h"
#include <cstddef>
#include <memory>
#include <string>

namespace tbrsa {

class Session {
public:
    Session() = default;
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Replace the held key pair with one built from p and q
     *
     * On failure the current key pair stays in place.
     *
     * @throws InvalidKeyError see rsa::generate_keypair()
     */
    const rsa::RSAKeyPair& generate_keys(const ZZ& p, const ZZ& q, const ZZ& e = ZZ(0));

    /**
     * @brief Replace the held key pair with a random one
     * @throws InvalidKeyError see rsa::generate_random_keypair()
     */
    const rsa::RSAKeyPair& generate_random_keys(
        size_t bits, const ZZ& e = ZZ(TBRSA_DEFAULT_PUBLIC_EXPONENT));

    /**
     * @brief Install a caller-supplied key pair
     * @throws InvalidKeyError if kp.is_valid() is false
     */
    void set_keys(const rsa::RSAKeyPair& kp);

    bool has_keys() const { return keys_ != nullptr; }

    /**
     * @throws std::logic_error if no key pair is held
     */
    const rsa::RSAKeyPair& keys() const;
    rsa::RSAPublicKey public_key() const;

    rsa::Ciphertext encrypt(const std::string& plaintext);
    std::string decrypt(const rsa::Ciphertext& ciphertext) const;

    std::string encrypt_text(const std::string& plaintext);
    std::string decrypt_text(const std::string& b64) const;

    /// Result of the most recent successful encrypt(); empty if none
    const rsa::Ciphertext& last_ciphertext() const { return last_ciphertext_; }

    /// Result of the most recent successful encrypt_text(); empty if none
    const std::string& last_block_ciphertext() const { return last_block_; }

    /**
     * @brief Wipe keys and ciphertexts; the session can be reused
     */
    void clear();

private:
    const rsa::RSAKeyPair& require_keys() const;
    void install(rsa::RSAKeyPair&& kp);
    Random& rng();

    std::unique_ptr<rsa::RSAKeyPair> keys_;
    std::unique_ptr<Random> rng_;
    rsa::Ciphertext last_ciphertext_;
    std::string last_block_;
};

} // namespace tbrsa

#endif // TBRSA_SESSION_H
