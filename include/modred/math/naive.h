/**
 * @file naive.h
 * @brief Reference modular arithmetic via GMP remainder
 *
 * Correctness oracle and performance baseline for the reduction engines.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_MATH_NAIVE_H
#define MODRED_MATH_NAIVE_H

#include <gmpxx.h>
#include <cstddef>

namespace modred {
namespace math {

class NaiveEngine {
public:
    /**
     * @throws modred::InvalidModulus if n <= 0
     */
    explicit NaiveEngine(const mpz_class& n);

    /** @brief (a * b) mod n */
    mpz_class multiply(const mpz_class& a, const mpz_class& b) const;

    /** @brief (a + b) mod n */
    mpz_class add(const mpz_class& a, const mpz_class& b) const;

    const mpz_class& modulus() const noexcept { return n_; }
    size_t num_bits() const noexcept { return mpz_sizeinbase(n_.get_mpz_t(), 2); }

private:
    mpz_class n_;
};

} // namespace math
} // namespace modred

#endif // MODRED_MATH_NAIVE_H
