/**
 * @file security.cpp
 * @brief Security Primitives Implementation
 *
 * - Secure memory zeroing through a volatile function pointer
 * - Platform CSPRNG (BCryptGenRandom on Windows; getrandom, then /dev/urandom elsewhere)
 * - Wiping of GMP integers that held private key material
 *
 * C++ Core + C ABI Architecture
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "tbrsa/core/security.h"
#include "tbrsa/core/common.h"
#include <cstring>
#include <cstdint>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <bcrypt.h>
#ifndef STATUS_SUCCESS
constexpr NTSTATUS TBRSA_STATUS_SUCCESS = 0x00000000L;
#define STATUS_SUCCESS TBRSA_STATUS_SUCCESS
#endif
#else
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#if defined(__linux__)
// sys/random.h requires glibc 2.25+, use the raw syscall instead
#include <sys/syscall.h>
#ifdef SYS_getrandom
#define TBRSA_HAS_GETRANDOM_SYSCALL 1
static inline ssize_t tbrsa_getrandom(void* buf, size_t len, unsigned int flags) {
    return syscall(SYS_getrandom, buf, len, flags);
}
#endif
#endif
#endif

namespace tbrsa {
namespace internal {

// ============================================================================
// Compiler Memory Barrier
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#else
#define COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Memory Operations
// ============================================================================

// Volatile function pointer to prevent optimization
using SecureZeroFn = void (*volatile)(void*, size_t);

static void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

static SecureZeroFn secure_zero_ptr = secure_zero_impl;

void secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;

    secure_zero_ptr(ptr, len);

    COMPILER_BARRIER();
}

void wipe(mpz_class& z) {
    mpz_ptr raw = z.get_mpz_t();
    if (raw->_mp_alloc > 0 && raw->_mp_d != nullptr) {
        secure_zero(raw->_mp_d, static_cast<size_t>(raw->_mp_alloc) * sizeof(mp_limb_t));
    }
    mpz_set_ui(raw, 0);
}

// ============================================================================
// Random Bytes
// ============================================================================

#ifdef _WIN32

int random_bytes(void* buf, size_t len) {
    if (!buf) return TBRSA_ERROR_INVALID_PARAM;
    if (len == 0) return TBRSA_SUCCESS;

    NTSTATUS status = BCryptGenRandom(
        nullptr,
        static_cast<PUCHAR>(buf),
        static_cast<ULONG>(len),
        BCRYPT_USE_SYSTEM_PREFERRED_RNG
    );

    return (status == STATUS_SUCCESS) ? TBRSA_SUCCESS : TBRSA_ERROR_RANDOM_FAILED;
}

#else

static int read_urandom(unsigned char* p, size_t remaining) {
    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        // Try without O_CLOEXEC for older kernels
        fd = open("/dev/urandom", O_RDONLY);
        if (fd < 0) return TBRSA_ERROR_RANDOM_FAILED;
    }

    while (remaining > 0) {
        ssize_t ret = read(fd, p, remaining);
        if (ret < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return TBRSA_ERROR_RANDOM_FAILED;
        }
        if (ret == 0) {
            close(fd);
            return TBRSA_ERROR_RANDOM_FAILED;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }
    close(fd);
    return TBRSA_SUCCESS;
}

int random_bytes(void* buf, size_t len) {
    if (!buf) return TBRSA_ERROR_INVALID_PARAM;
    if (len == 0) return TBRSA_SUCCESS;

    unsigned char* p = static_cast<unsigned char*>(buf);
    size_t remaining = len;

#ifdef TBRSA_HAS_GETRANDOM_SYSCALL
    while (remaining > 0) {
        ssize_t ret = tbrsa_getrandom(p, remaining, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;  // ENOSYS and friends: fall back to /dev/urandom
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }

    if (remaining == 0) return TBRSA_SUCCESS;
#endif

    return read_urandom(p, remaining);
}

#endif

} // namespace internal
} // namespace tbrsa

// ============================================================================
// C ABI
// ============================================================================

extern "C" {

void tbrsa_secure_zero(void* ptr, size_t len) {
    tbrsa::internal::secure_zero(ptr, len);
}

int tbrsa_random_bytes(void* buf, size_t len) {
    return tbrsa::internal::random_bytes(buf, len);
}

}  // extern "C"
