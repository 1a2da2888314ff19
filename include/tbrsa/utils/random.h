/**
 * @file random.h
 * @brief Random integer source for prime generation
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef TBRSA_UTILS_RANDOM_H
#define TBRSA_UTILS_RANDOM_H

#include "tbrsa/core/common.h"
#include <gmpxx.h>
#include <cstddef>

namespace tbrsa {

/**
 * @brief GMP Mersenne Twister state seeded from the OS CSPRNG
 *
 * Each instance owns its own state; nothing is shared between instances.
 * seed() makes a run reproducible (tests only).
 */
class Random {
public:
    /**
     * @brief Construct and seed from tbrsa_random_bytes()
     * @throws std::runtime_error if the OS random source fails
     */
    Random();

    /**
     * @brief Construct with a fixed seed
     */
    explicit Random(unsigned long seed);

    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    void seed(unsigned long s);

    /**
     * @brief Uniform integer with at most @p bits bits
     */
    mpz_class bits(size_t bits);

    /**
     * @brief Uniform integer in [lo, hi]
     * @throws std::invalid_argument if hi < lo
     */
    mpz_class range(const mpz_class& lo, const mpz_class& hi);

private:
    gmp_randclass state_;
};

} // namespace tbrsa

#endif // TBRSA_UTILS_RANDOM_H
