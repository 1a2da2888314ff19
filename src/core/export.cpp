/**
 * @file export.cpp
 * @brief C ABI over the C++ core
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "tbrsa/tbrsa_api.h"
#include "tbrsa/core/errors.h"
#include "tbrsa/core/security.h"
#include "tbrsa/crypto/rsa/rsa_keygen.h"
#include "tbrsa/math/arith.h"

#include <new>
#include <stdexcept>

namespace {

// One native-endian 64-bit word; unsigned long may be only 32 bits wide
tbrsa::ZZ from_u64(uint64_t v) {
    tbrsa::ZZ z;
    mpz_import(z.get_mpz_t(), 1, 1, sizeof(v), 0, 0, &v);
    return z;
}

bool to_u64(const tbrsa::ZZ& z, uint64_t* out) {
    if (z < 0 || mpz_sizeinbase(z.get_mpz_t(), 2) > 64) return false;
    uint64_t v = 0;
    mpz_export(&v, nullptr, 1, sizeof(v), 0, 0, z.get_mpz_t());
    *out = v;
    return true;
}

} // namespace

extern "C" {

const char* tbrsa_version(void) {
    return TBRSA_VERSION_STRING;
}

const char* tbrsa_platform(void) {
    return TBRSA_PLATFORM_NAME;
}

const char* tbrsa_error_string(tbrsa_error_t error) {
    switch (error) {
        case TBRSA_SUCCESS:
            return "Success";
        case TBRSA_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case TBRSA_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case TBRSA_ERROR_INVALID_KEY:
            return "Invalid key";
        case TBRSA_ERROR_NON_INVERTIBLE:
            return "No modular inverse exists";
        case TBRSA_ERROR_ENCODING_RANGE:
            return "Value outside the encodable range";
        case TBRSA_ERROR_INTERNAL:
            return "Internal error";
        case TBRSA_ERROR_RANDOM_FAILED:
            return "Random source failed";
        default:
            return "Unknown error";
    }
}

tbrsa_error_t tbrsa_mod_pow_u64(uint64_t base, uint64_t exponent,
                                uint64_t modulus, uint64_t* result) {
    if (result == nullptr || modulus == 0) {
        return TBRSA_ERROR_INVALID_PARAM;
    }
    try {
        tbrsa::ZZ r = tbrsa::math::mod_pow(from_u64(base), from_u64(exponent), from_u64(modulus));
        return to_u64(r, result) ? TBRSA_SUCCESS : TBRSA_ERROR_INTERNAL;
    } catch (const std::bad_alloc&) {
        return TBRSA_ERROR_INTERNAL;
    }
}

tbrsa_error_t tbrsa_mod_inverse_u64(uint64_t a, uint64_t m, uint64_t* result) {
    if (result == nullptr || m == 0) {
        return TBRSA_ERROR_INVALID_PARAM;
    }
    try {
        tbrsa::ZZ r = tbrsa::math::mod_inverse(from_u64(a), from_u64(m));
        return to_u64(r, result) ? TBRSA_SUCCESS : TBRSA_ERROR_INTERNAL;
    } catch (const tbrsa::NonInvertibleError& ex) {
        return ex.code();
    } catch (const std::bad_alloc&) {
        return TBRSA_ERROR_INTERNAL;
    }
}

tbrsa_error_t tbrsa_generate_keypair_u64(uint64_t p, uint64_t q, uint64_t e,
                                         uint64_t* n_out, uint64_t* e_out,
                                         uint64_t* d_out) {
    if (n_out == nullptr || e_out == nullptr || d_out == nullptr) {
        return TBRSA_ERROR_INVALID_PARAM;
    }
    try {
        tbrsa::rsa::RSAKeyPair kp =
            tbrsa::rsa::generate_keypair(from_u64(p), from_u64(q), from_u64(e));
        uint64_t n = 0, ev = 0, d = 0;
        if (!to_u64(kp.n, &n) || !to_u64(kp.e, &ev) || !to_u64(kp.d, &d)) {
            return TBRSA_ERROR_INVALID_PARAM;
        }
        *n_out = n;
        *e_out = ev;
        *d_out = d;
        tbrsa::internal::secure_zero(&d, sizeof(d));
        return TBRSA_SUCCESS;
    } catch (const tbrsa::InvalidKeyError& ex) {
        return ex.code();
    } catch (const std::bad_alloc&) {
        return TBRSA_ERROR_INTERNAL;
    }
}

} // extern "C"
