/**
 * @file random.h
 * @brief Random residue generation for tests and benchmarks
 *
 * Not for key material: GMP's default generator (Mersenne Twister) seeded
 * explicitly so runs can be reproduced.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef MODRED_UTILS_RANDOM_H
#define MODRED_UTILS_RANDOM_H

#include <gmpxx.h>
#include <cstddef>
#include <vector>

namespace modred {
namespace utils {

/**
 * @brief Uniform sampler of residues in [0, bound)
 */
class ResidueSampler {
public:
    explicit ResidueSampler(unsigned long seed);

    /**
     * @brief Uniform value in [0, bound)
     * @throws std::invalid_argument if bound <= 0
     */
    mpz_class below(const mpz_class& bound);

    /** @brief count independent values in [0, bound) */
    std::vector<mpz_class> sample(const mpz_class& bound, size_t count);

    unsigned long seed() const noexcept { return seed_; }

private:
    gmp_randclass state_;
    unsigned long seed_;
};

/**
 * @brief Seed derived from the high-resolution clock
 */
unsigned long clock_seed();

} // namespace utils
} // namespace modred

#endif // MODRED_UTILS_RANDOM_H
