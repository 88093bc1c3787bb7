/**
 * @file montgomery.h
 * @brief Montgomery Modular Arithmetic API
 *
 * Modular multiplication without trial division for arbitrary-size odd
 * moduli, on top of GMP integers.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_MATH_MONTGOMERY_H
#define MODRED_MATH_MONTGOMERY_H

#include <gmpxx.h>
#include <cstddef>
#include <utility>

namespace modred {
namespace math {

class MontgomeryEngine;

/**
 * @brief A residue held in Montgomery form (x * R mod n)
 *
 * Only MontgomeryEngine creates these, so a standard-form residue cannot be
 * passed where a Montgomery-form one is expected.
 */
class MontgomeryValue {
public:
    MontgomeryValue() = default;

    /** @brief Raw representative x * R mod n */
    const mpz_class& get() const noexcept { return value_; }

    bool operator==(const MontgomeryValue& other) const { return value_ == other.value_; }
    bool operator!=(const MontgomeryValue& other) const { return value_ != other.value_; }

private:
    friend class MontgomeryEngine;
    explicit MontgomeryValue(mpz_class value) : value_(std::move(value)) {}

    mpz_class value_;
};

/**
 * @brief Montgomery parameters derived once per modulus
 */
struct MontgomeryContext {
    mpz_class n;            ///< Modulus (odd, positive)
    size_t k = 0;           ///< bitlength(n), R = 2^k
    mpz_class r;            ///< Radix R = 2^k
    mpz_class r_mask;       ///< R - 1
    mpz_class n_prime;      ///< -n^-1 mod R, in [0, R)
    mpz_class r2_mod_n;     ///< R^2 mod n (for conversion)
    mpz_class r_mod_n;      ///< R mod n (Montgomery form of 1)

    bool operator==(const MontgomeryContext& other) const {
        return n == other.n && k == other.k && r == other.r &&
               n_prime == other.n_prime && r2_mod_n == other.r2_mod_n;
    }
    bool operator!=(const MontgomeryContext& other) const { return !(*this == other); }
};

/**
 * @brief Montgomery reduction engine
 *
 * Usage:
 * ```cpp
 * MontgomeryEngine mont(n);                    // n odd
 * MontgomeryValue a_m = mont.to_montgomery(a);
 * MontgomeryValue b_m = mont.to_montgomery(b);
 * MontgomeryValue p_m = mont.multiply(a_m, b_m); // (ab)R mod n
 * mpz_class p = mont.from_montgomery(p_m);       // ab mod n
 * ```
 *
 * The context is immutable after construction; one engine may be shared
 * by any number of readers.
 */
class MontgomeryEngine {
public:
    /**
     * @brief Derive the Montgomery context for modulus n
     * @throws modred::InvalidModulus if n is even or n <= 0
     */
    explicit MontgomeryEngine(const mpz_class& n);

    /**
     * @brief Convert to Montgomery form: x -> xR mod n
     * @param x Standard-form residue in [0, n)
     */
    MontgomeryValue to_montgomery(const mpz_class& x) const;

    /**
     * @brief Convert from Montgomery form: xR -> x, result in [0, n)
     */
    mpz_class from_montgomery(const MontgomeryValue& x) const;

    /**
     * @brief Montgomery multiplication: (aR * bR * R^-1) mod n = (ab)R mod n
     */
    MontgomeryValue multiply(const MontgomeryValue& a, const MontgomeryValue& b) const;

    /**
     * @brief Montgomery-form addition: (aR + bR) mod n = (a+b)R mod n
     */
    MontgomeryValue add(const MontgomeryValue& a, const MontgomeryValue& b) const;

    /** @brief Montgomery form of 1 */
    MontgomeryValue one() const { return MontgomeryValue(ctx_.r_mod_n); }

    /**
     * @brief Montgomery reduction: REDC(T) = T * R^-1 mod n
     *
     * @param t Input in [0, n*R)
     * @return Canonical result in [0, n)
     */
    mpz_class redc(const mpz_class& t) const;

    // Accessors
    const MontgomeryContext& context() const noexcept { return ctx_; }
    const mpz_class& modulus() const noexcept { return ctx_.n; }
    size_t num_bits() const noexcept { return ctx_.k; }
    const mpz_class& radix() const noexcept { return ctx_.r; }
    const mpz_class& n_prime() const noexcept { return ctx_.n_prime; }
    const mpz_class& r_squared() const noexcept { return ctx_.r2_mod_n; }

private:
    MontgomeryContext ctx_;
};

} // namespace math
} // namespace modred

#endif // MODRED_MATH_MONTGOMERY_H
