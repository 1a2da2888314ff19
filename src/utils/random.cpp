/**
 * @file random.cpp
 * @brief Random integer source implementation
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "tbrsa/utils/random.h"
#include "tbrsa/core/security.h"
#include <array>
#include <stdexcept>

namespace tbrsa {

namespace {

mpz_class os_seed() {
    std::array<unsigned char, 32> buf{};
    int rc = internal::random_bytes(buf.data(), buf.size());
    if (rc != TBRSA_SUCCESS) {
        throw std::runtime_error("Random: OS random source unavailable");
    }
    mpz_class s;
    mpz_import(s.get_mpz_t(), buf.size(), 1, 1, 1, 0, buf.data());
    internal::secure_zero(buf.data(), buf.size());
    return s;
}

} // namespace

Random::Random() : state_(gmp_randinit_mt) {
    mpz_class s = os_seed();
    state_.seed(s);
    internal::wipe(s);
}

Random::Random(unsigned long seed) : state_(gmp_randinit_mt) {
    state_.seed(seed);
}

void Random::seed(unsigned long s) {
    state_.seed(s);
}

mpz_class Random::bits(size_t bits) {
    if (bits == 0) return mpz_class(0);
    return state_.get_z_bits(static_cast<mp_bitcnt_t>(bits));
}

mpz_class Random::range(const mpz_class& lo, const mpz_class& hi) {
    if (hi < lo) {
        throw std::invalid_argument("Random::range: empty range");
    }
    mpz_class span = hi - lo + 1;
    return lo + state_.get_z_range(span);
}

} // namespace tbrsa
