/**
 * @file config.h
 * @brief Compile-time tuning for tbrsa
 *
 * Every value may be overridden with -D on the compiler command line.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_CORE_CONFIG_H
#define TBRSA_CORE_CONFIG_H

/*
 * public exponent tried first when the caller does not pick one
 */
#ifndef TBRSA_DEFAULT_PUBLIC_EXPONENT
#define TBRSA_DEFAULT_PUBLIC_EXPONENT 65537UL
#endif

/*
 * bit length window for random demonstration primes
 */
#ifndef TBRSA_MIN_PRIME_BITS
#define TBRSA_MIN_PRIME_BITS 8
#endif

#ifndef TBRSA_MAX_PRIME_BITS
#define TBRSA_MAX_PRIME_BITS 512
#endif

#if TBRSA_MIN_PRIME_BITS < 4 || TBRSA_MAX_PRIME_BITS < TBRSA_MIN_PRIME_BITS
#error "invalid prime bit window"
#endif

/*
 * extra random Miller-Rabin bases beyond the fixed deterministic set
 */
#ifndef TBRSA_MILLER_RABIN_ROUNDS
#define TBRSA_MILLER_RABIN_ROUNDS 24
#endif

/*
 * prime pairs drawn before random key generation gives up
 */
#ifndef TBRSA_KEYGEN_MAX_ATTEMPTS
#define TBRSA_KEYGEN_MAX_ATTEMPTS 64
#endif

#endif // TBRSA_CORE_CONFIG_H
