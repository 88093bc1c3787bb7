/**
 * @file random.cpp
 * @brief Random residue generation backed by GMP
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "modred/utils/random.h"
#include <chrono>
#include <stdexcept>

namespace modred {
namespace utils {

ResidueSampler::ResidueSampler(unsigned long seed)
    : state_(gmp_randinit_default), seed_(seed)
{
    state_.seed(seed);
}

mpz_class ResidueSampler::below(const mpz_class& bound) {
    if (sgn(bound) <= 0) {
        throw std::invalid_argument("sampling bound must be positive");
    }
    return state_.get_z_range(bound);
}

std::vector<mpz_class> ResidueSampler::sample(const mpz_class& bound, size_t count) {
    std::vector<mpz_class> values;
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        values.push_back(below(bound));
    }
    return values;
}

unsigned long clock_seed() {
    auto ticks = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return static_cast<unsigned long>(ticks);
}

} // namespace utils
} // namespace modred
