/**
 * @file tbrsa_api.h
 * @brief tbrsa C API
 *
 * Plain-C entry points over the C++ core for 64-bit operands. Every call
 * returns a tbrsa_error_t instead of throwing.
 *
 * Usage:
 * @code
 *   #include <tbrsa/tbrsa_api.h>
 *
 *   uint64_t n, e, d;
 *   if (tbrsa_generate_keypair_u64(61, 53, 17, &n, &e, &d) == TBRSA_SUCCESS) {
 *       uint64_t c;
 *       tbrsa_mod_pow_u64(65, e, n, &c);   // c == 2790
 *   }
 * @endcode
 *
 * @author knightc
 * @version 1.2.0
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef TBRSA_API_H
#define TBRSA_API_H

#include "tbrsa/core/common.h"
#include "tbrsa/version.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Library version string ("major.minor.patch")
 */
TBRSA_API const char* tbrsa_version(void);

/**
 * @brief Platform name the library was built for
 */
TBRSA_API const char* tbrsa_platform(void);

/**
 * @brief result = base^exponent mod modulus
 * @return TBRSA_SUCCESS, or TBRSA_ERROR_INVALID_PARAM for modulus 0 or a NULL result
 */
TBRSA_API tbrsa_error_t tbrsa_mod_pow_u64(uint64_t base, uint64_t exponent,
                                          uint64_t modulus, uint64_t* result);

/**
 * @brief result = a^(-1) mod m
 * @return TBRSA_SUCCESS, TBRSA_ERROR_NON_INVERTIBLE or TBRSA_ERROR_INVALID_PARAM
 */
TBRSA_API tbrsa_error_t tbrsa_mod_inverse_u64(uint64_t a, uint64_t m, uint64_t* result);

/**
 * @brief Build a key pair from two primes
 * @param p First prime
 * @param q Second prime
 * @param e Public exponent, 0 to let the library choose
 * @param n_out Modulus
 * @param e_out Public exponent used
 * @param d_out Private exponent
 * @return TBRSA_SUCCESS, TBRSA_ERROR_INVALID_KEY, or TBRSA_ERROR_INVALID_PARAM
 *         for NULL outputs or a modulus wider than 64 bits
 */
TBRSA_API tbrsa_error_t tbrsa_generate_keypair_u64(uint64_t p, uint64_t q, uint64_t e,
                                                   uint64_t* n_out, uint64_t* e_out,
                                                   uint64_t* d_out);

#ifdef __cplusplus
}
#endif

#endif /* TBRSA_API_H */
