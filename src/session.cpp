/**
 * @file session.cpp
 * @brief Session context implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "tbrsa/session.h"
#include "tbrsa/core/errors.h"
#include "tbrsa/core/security.h"
#include "tbrsa/crypto/rsa/rsa_encrypt.h"
#include "tbrsa/crypto/rsa/rsa_keygen.h"
#include <memory>
#include <stdexcept>
#include <utility>

namespace tbrsa {

Session::~Session() {
    clear();
}

const rsa::RSAKeyPair& Session::generate_keys(const ZZ& p, const ZZ& q, const ZZ& e) {
    install(rsa::generate_keypair(p, q, e));
    return *keys_;
}

const rsa::RSAKeyPair& Session::generate_random_keys(size_t bits, const ZZ& e) {
    install(rsa::generate_random_keypair(bits, e, rng()));
    return *keys_;
}

void Session::set_keys(const rsa::RSAKeyPair& kp) {
    if (!kp.is_valid()) {
        throw InvalidKeyError("Key pair failed validation");
    }
    rsa::RSAKeyPair copy(kp);
    install(std::move(copy));
}

const rsa::RSAKeyPair& Session::keys() const {
    return require_keys();
}

rsa::RSAPublicKey Session::public_key() const {
    return require_keys().public_key();
}

rsa::Ciphertext Session::encrypt(const std::string& plaintext) {
    rsa::Ciphertext ct = rsa::encrypt(plaintext, require_keys().public_key());
    last_ciphertext_ = ct;
    return ct;
}

std::string Session::decrypt(const rsa::Ciphertext& ciphertext) const {
    return rsa::decrypt(ciphertext, require_keys().private_key());
}

std::string Session::encrypt_text(const std::string& plaintext) {
    std::string b64 = rsa::encrypt_text(plaintext, require_keys().public_key());
    last_block_ = b64;
    return b64;
}

std::string Session::decrypt_text(const std::string& b64) const {
    return rsa::decrypt_text(b64, require_keys().private_key());
}

void Session::clear() {
    keys_.reset();  // RSAKeyPair wipes itself
    for (ZZ& c : last_ciphertext_) {
        internal::wipe(c);
    }
    last_ciphertext_.clear();
    internal::secure_zero(&last_block_[0], last_block_.size());
    last_block_.clear();
}

const rsa::RSAKeyPair& Session::require_keys() const {
    if (!keys_) {
        throw std::logic_error("No key pair loaded. Generate keys first.");
    }
    return *keys_;
}

void Session::install(rsa::RSAKeyPair&& kp) {
    // A new key invalidates ciphertexts made under the old one
    clear();
    keys_ = std::make_unique<rsa::RSAKeyPair>(std::move(kp));
}

Random& Session::rng() {
    if (!rng_) {
        rng_ = std::make_unique<Random>();
    }
    return *rng_;
}

} // namespace tbrsa
