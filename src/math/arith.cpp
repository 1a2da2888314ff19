/**
 * @file arith.cpp
 * @brief Extended Euclid, modular inverse and square-and-multiply
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "tbrsa/math/arith.h"
#include "tbrsa/core/errors.h"
#include <stdexcept>
#include <utility>

namespace tbrsa {
namespace math {

ZZ mod_floor(const ZZ& a, const ZZ& m) {
    if (m < 1) {
        throw std::invalid_argument("mod_floor: modulus must be positive");
    }
    ZZ r;
    mpz_fdiv_r(r.get_mpz_t(), a.get_mpz_t(), m.get_mpz_t());
    return r;
}

ExtGCDResult extended_gcd(const ZZ& a, const ZZ& b) {
    // Invariants: old_r = a*old_s + b*old_t, r = a*s + b*t
    ZZ old_r = a, r = b;
    ZZ old_s = 1, s = 0;
    ZZ old_t = 0, t = 1;

    while (r != 0) {
        ZZ q;
        mpz_tdiv_q(q.get_mpz_t(), old_r.get_mpz_t(), r.get_mpz_t());

        ZZ next = old_r - q * r;
        old_r = std::move(r);
        r = std::move(next);

        next = old_s - q * s;
        old_s = std::move(s);
        s = std::move(next);

        next = old_t - q * t;
        old_t = std::move(t);
        t = std::move(next);
    }

    if (old_r < 0) {
        old_r = -old_r;
        old_s = -old_s;
        old_t = -old_t;
    }
    return ExtGCDResult{old_r, old_s, old_t};
}

ZZ gcd(const ZZ& a, const ZZ& b) {
    return extended_gcd(a, b).g;
}

ZZ mod_inverse(const ZZ& a, const ZZ& m) {
    if (m < 1) {
        throw NonInvertibleError("mod_inverse: modulus must be positive");
    }
    if (m == 1) return ZZ(0);

    ExtGCDResult r = extended_gcd(mod_floor(a, m), m);
    if (r.g != 1) {
        throw NonInvertibleError("No modular inverse for " + a.get_str() +
                                 " mod " + m.get_str() +
                                 " (gcd = " + r.g.get_str() + ")");
    }
    return mod_floor(r.x, m);
}

ZZ mod_pow(const ZZ& base, const ZZ& exponent, const ZZ& modulus) {
    if (modulus < 1) {
        throw std::invalid_argument("mod_pow: modulus must be positive");
    }
    if (exponent < 0) {
        throw std::invalid_argument("mod_pow: negative exponent");
    }
    if (modulus == 1) return ZZ(0);

    ZZ result = 1;
    ZZ b = mod_floor(base, modulus);
    const size_t nbits = mpz_sizeinbase(exponent.get_mpz_t(), 2);

    // Right-to-left binary method
    for (size_t i = 0; i < nbits; i++) {
        if (mpz_tstbit(exponent.get_mpz_t(), i)) {
            result = (result * b) % modulus;
        }
        if (i + 1 < nbits) {
            b = (b * b) % modulus;
        }
    }
    return result;
}

} // namespace math
} // namespace tbrsa
