/**
 * @file barrett.h
 * @brief Barrett reduction over GMP integers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_MATH_BARRETT_H
#define MODRED_MATH_BARRETT_H

#include <gmpxx.h>
#include <cstddef>

namespace modred {
namespace math {

/**
 * @brief Barrett parameters, recomputed only when the modulus changes
 */
struct BarrettContext {
    mpz_class n;        ///< Modulus (positive)
    size_t k = 0;       ///< bitlength(n)
    mpz_class mu;       ///< floor(2^(2k) / n)
};

/**
 * @brief Barrett reduction engine
 *
 * Operands and results stay in standard form; there is no domain
 * conversion step.
 */
class BarrettEngine {
public:
    /**
     * @brief Precompute mu for modulus n (odd or even)
     * @throws modred::InvalidModulus if n <= 0
     */
    explicit BarrettEngine(const mpz_class& n);

    /**
     * @brief Reduce x in [0, n^2) to x mod n
     *
     * q = ((x >> k) * mu) >> k undershoots floor(x / n) by at most 2, so the
     * correction loop runs at most twice for inputs in range.
     */
    mpz_class reduce(const mpz_class& x) const;

    /** @brief (a * b) mod n for a, b in [0, n) */
    mpz_class multiply(const mpz_class& a, const mpz_class& b) const;

    /** @brief (a + b) mod n for a, b in [0, n) */
    mpz_class add(const mpz_class& a, const mpz_class& b) const;

    // Accessors
    const BarrettContext& context() const noexcept { return ctx_; }
    const mpz_class& modulus() const noexcept { return ctx_.n; }
    size_t num_bits() const noexcept { return ctx_.k; }
    const mpz_class& mu() const noexcept { return ctx_.mu; }

private:
    BarrettContext ctx_;
};

} // namespace math
} // namespace modred

#endif // MODRED_MATH_BARRETT_H
