/**
 * @file errors.h
 * @brief Exception types thrown by the tbrsa C++ API
 *
 * Each type derives from the standard exception that best describes the
 * failure, so callers may catch either the tbrsa type or the std base.
 * code() maps the exception onto the C ABI error codes.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_CORE_ERRORS_H
#define TBRSA_CORE_ERRORS_H

#include "tbrsa/core/common.h"
#include <stdexcept>
#include <string>

namespace tbrsa {

/**
 * @brief Key material cannot form a valid RSA key pair
 *
 * Raised for equal or non-prime factors, an unusable public exponent,
 * or a key pair that fails its consistency check.
 */
class InvalidKeyError : public std::invalid_argument {
public:
    explicit InvalidKeyError(const std::string& what)
        : std::invalid_argument(what) {}

    tbrsa_error_t code() const noexcept { return TBRSA_ERROR_INVALID_KEY; }
};

/**
 * @brief No modular inverse exists (gcd(a, m) != 1)
 */
class NonInvertibleError : public std::domain_error {
public:
    explicit NonInvertibleError(const std::string& what)
        : std::domain_error(what) {}

    tbrsa_error_t code() const noexcept { return TBRSA_ERROR_NON_INVERTIBLE; }
};

/**
 * @brief A value does not fit in [0, n) or cannot be mapped back to text
 */
class EncodingRangeError : public std::out_of_range {
public:
    explicit EncodingRangeError(const std::string& what)
        : std::out_of_range(what) {}

    tbrsa_error_t code() const noexcept { return TBRSA_ERROR_ENCODING_RANGE; }
};

} // namespace tbrsa

#endif // TBRSA_CORE_ERRORS_H
