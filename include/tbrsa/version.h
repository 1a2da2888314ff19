/**
 * @file version.h
 * @brief Unified Version Information for tbrsa Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef TBRSA_VERSION_H
#define TBRSA_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define TBRSA_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define TBRSA_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define TBRSA_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define TBRSA_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define TBRSA_VERSION_NUMBER ((TBRSA_VERSION_MAJOR * 10000) + \
                              (TBRSA_VERSION_MINOR * 100) + \
                              TBRSA_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define TBRSA_RELEASE_DATE "2026-10-19"

/** Library name */
#define TBRSA_LIBRARY_NAME "tbrsa"

/** Full library description */
#define TBRSA_DESCRIPTION "Textbook RSA teaching library"

/** Build type identifier */
#ifdef NDEBUG
#define TBRSA_BUILD_TYPE "Release"
#else
#define TBRSA_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define TBRSA_VERSION_AT_LEAST(major, minor, patch) \
    (TBRSA_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* TBRSA_VERSION_H */
