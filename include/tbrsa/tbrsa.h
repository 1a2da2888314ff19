/**
 * @file tbrsa.h
 * @brief tbrsa - Textbook RSA teaching library
 * 
 * Unified header for all modules.
 * 
 * Modules:
 * - Math: extended Euclid, modular inverse, modular power, Miller-Rabin
 * - RSA: key generation, per-character and block encryption
 * - Session: explicit context holding one key pair
 * - Utils: Base64, UTF-8, integer/byte conversion
 * 
 * Big integers are GMP mpz_class values (alias tbrsa::ZZ).
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_H
#define TBRSA_H

#include "tbrsa/version.h"
#include "tbrsa/core/common.h"
#include "tbrsa/core/config.h"
#include "tbrsa/core/errors.h"
#include "tbrsa/core/types.h"

#include "tbrsa/math/arith.h"             // extended_gcd, mod_inverse, mod_pow
#include "tbrsa/math/prime.h"             // is_probable_prime, random_prime

#include "tbrsa/crypto/rsa/rsa_types.h"   // RSAPublicKey, RSAPrivateKey, RSAKeyPair
#include "tbrsa/crypto/rsa/rsa_keygen.h"  // generate_keypair, generate_random_keypair
#include "tbrsa/crypto/rsa/rsa_encrypt.h" // encrypt, decrypt, encrypt_text, decrypt_text

#include "tbrsa/session.h"
#include "tbrsa/utils/encoding.h"
#include "tbrsa/utils/random.h"

#endif // TBRSA_H
