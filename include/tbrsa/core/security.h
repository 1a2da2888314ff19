/**
 * @file security.h
 * @brief Security primitives for tbrsa - secure wiping and OS randomness
 * 
 * This header provides:
 * - Secure memory zeroing (not optimized away)
 * - Cryptographically secure random bytes from the operating system
 * - Wiping of GMP integers holding private key material
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_CORE_SECURITY_H
#define TBRSA_CORE_SECURITY_H

#include "tbrsa/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Secure memory zeroing
 * 
 * Securely zeros memory, guaranteed not to be optimized away by compiler.
 * 
 * @param ptr Pointer to memory to zero
 * @param len Number of bytes to zero
 */
TBRSA_API void tbrsa_secure_zero(void* ptr, size_t len);

/**
 * @brief Fill a buffer from the operating system CSPRNG
 * @param buf Output buffer
 * @param len Number of bytes
 * @return TBRSA_SUCCESS, TBRSA_ERROR_INVALID_PARAM or TBRSA_ERROR_RANDOM_FAILED
 */
TBRSA_API int tbrsa_random_bytes(void* buf, size_t len);

#ifdef __cplusplus
}

#include <gmpxx.h>

namespace tbrsa {
namespace internal {

void secure_zero(void* ptr, size_t len);
int random_bytes(void* buf, size_t len);

/**
 * @brief Overwrite the limbs of an integer and reset it to zero
 */
void wipe(mpz_class& z);

} // namespace internal
} // namespace tbrsa

#endif

#endif // TBRSA_CORE_SECURITY_H
