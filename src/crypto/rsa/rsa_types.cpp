/**
 * @file rsa_types.cpp
 * @brief RSA key validation and wiping
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "tbrsa/crypto/rsa/rsa_types.h"
#include "tbrsa/core/security.h"

namespace tbrsa {
namespace rsa {

std::string RSAPublicKey::to_string() const {
    return "e = " + e.get_str() + "\nn = " + n.get_str();
}

void RSAPrivateKey::clear() {
    internal::wipe(d);
    internal::wipe(n);
}

ZZ RSAKeyPair::phi() const {
    if (!has_factors()) return ZZ(0);
    return ZZ((p - 1) * (q - 1));
}

bool RSAKeyPair::is_valid() const {
    if (n <= 1) return false;
    if (e <= 1 || e >= n) return false;
    if (d <= 0 || d >= n) return false;

    if (has_factors()) {
        if (p == q || n != p * q) return false;
        ZZ totient = phi();
        if (totient < 1) return false;
        ZZ ed = e * d;
        if (math::mod_floor(ed, totient) != 1) return false;
    }
    return true;
}

void RSAKeyPair::clear() {
    internal::wipe(d);
    internal::wipe(p);
    internal::wipe(q);
    internal::wipe(e);
    internal::wipe(n);
}

} // namespace rsa
} // namespace tbrsa
