/**
 * @file common.h
 * @brief Common definitions and utility macros for tbrsa library
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef TBRSA_CORE_COMMON_H
#define TBRSA_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define TBRSA_PLATFORM_WINDOWS 1
    #define TBRSA_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define TBRSA_PLATFORM_LINUX 1
    #define TBRSA_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define TBRSA_PLATFORM_MACOS 1
    #define TBRSA_PLATFORM_NAME "macOS"
#else
    #define TBRSA_PLATFORM_UNKNOWN 1
    #define TBRSA_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef TBRSA_PLATFORM_WINDOWS
    #ifdef TBRSA_SHARED_LIBRARY
        #ifdef TBRSA_BUILDING
            #define TBRSA_API __declspec(dllexport)
        #else
            #define TBRSA_API __declspec(dllimport)
        #endif
    #else
        #define TBRSA_API
    #endif
#else
    #ifdef TBRSA_SHARED_LIBRARY
        #define TBRSA_API __attribute__((visibility("default")))
    #else
        #define TBRSA_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    TBRSA_SUCCESS = 0,
    TBRSA_ERROR_INVALID_PARAM = -1,
    TBRSA_ERROR_BUFFER_TOO_SMALL = -2,
    TBRSA_ERROR_INVALID_KEY = -4,
    TBRSA_ERROR_NON_INVERTIBLE = -5,
    TBRSA_ERROR_ENCODING_RANGE = -6,
    TBRSA_ERROR_INTERNAL = -10,
    TBRSA_ERROR_RANDOM_FAILED = -12     // CSPRNG failure
} tbrsa_error_t;

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
TBRSA_API const char* tbrsa_error_string(tbrsa_error_t error);

#ifdef __cplusplus
}
#endif

#endif // TBRSA_CORE_COMMON_H
