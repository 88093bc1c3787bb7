/**
 * @file montgomery.cpp
 * @brief Montgomery Modular Arithmetic
 *
 * Montgomery form reduction for modular multiplication without division.
 *
 * Algorithm:
 * - MontgomeryForm(a) = a * R mod n (where R = 2^k > n)
 * - MontMul(aR, bR) = (aR * bR * R^-1) mod n = (ab)R mod n
 * - MontRed(aR) = (aR * R^-1) mod n = a mod n
 *
 * Only masking by R-1 and shifting by k happen per multiplication; the
 * single remainder (R^2 mod n) is paid once at construction.
 *
 * Reference:
 * - Montgomery, "Modular Multiplication Without Trial Division" (1985)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "modred/math/montgomery.h"
#include "modred/math/modinv.h"
#include "modred/core/error.h"

namespace modred {
namespace math {

/**
 * @brief Compute Montgomery parameter n' = -n^-1 mod R
 *
 * n' satisfies n * n' == -1 (mod R). Requires gcd(n, R) == 1, which holds
 * for odd n since R is a power of two.
 */
static mpz_class compute_n_prime(const mpz_class& n, const mpz_class& r) {
    mpz_class n_inv = inverse_mod(n, r);
    mpz_class n_prime = r - n_inv;
    if (n_prime == r) {
        n_prime = 0;
    }
    return n_prime;
}

MontgomeryEngine::MontgomeryEngine(const mpz_class& n) {
    if (sgn(n) <= 0) {
        throw InvalidModulus("Montgomery modulus must be positive, got " + n.get_str());
    }
    if (mpz_even_p(n.get_mpz_t())) {
        throw InvalidModulus("Montgomery modulus must be odd, got " + n.get_str());
    }

    ctx_.n = n;
    ctx_.k = mpz_sizeinbase(n.get_mpz_t(), 2);

    // R = 2^k, smallest power of two strictly greater than n
    ctx_.r = 1;
    ctx_.r <<= ctx_.k;
    ctx_.r_mask = ctx_.r - 1;

    ctx_.n_prime = compute_n_prime(n, ctx_.r);

    ctx_.r_mod_n = ctx_.r % n;
    ctx_.r2_mod_n = (ctx_.r_mod_n * ctx_.r_mod_n) % n;
}

/**
 * @brief Montgomery reduction: REDC(T) = T * R^-1 mod n
 *
 * 1. m = (T mod R) * n' mod R
 * 2. t = (T + m*n) / R        (exact; right shift by k)
 * 3. if t >= n: return t - n, else return t
 */
mpz_class MontgomeryEngine::redc(const mpz_class& t_in) const {
    mpz_class m = t_in & ctx_.r_mask;
    m *= ctx_.n_prime;
    m &= ctx_.r_mask;

    mpz_class t = m * ctx_.n;
    t += t_in;
    t >>= ctx_.k;

    // t < 2n here; always bring it back into [0, n)
    if (t >= ctx_.n) {
        t -= ctx_.n;
    }
    return t;
}

MontgomeryValue MontgomeryEngine::to_montgomery(const mpz_class& x) const {
    // xR = REDC(x * R^2 mod n)
    return MontgomeryValue(redc(x * ctx_.r2_mod_n));
}

mpz_class MontgomeryEngine::from_montgomery(const MontgomeryValue& x) const {
    return redc(x.get());
}

MontgomeryValue MontgomeryEngine::multiply(
    const MontgomeryValue& a,
    const MontgomeryValue& b) const
{
    return MontgomeryValue(redc(a.get() * b.get()));
}

MontgomeryValue MontgomeryEngine::add(
    const MontgomeryValue& a,
    const MontgomeryValue& b) const
{
    mpz_class s = a.get() + b.get();
    if (s >= ctx_.n) {
        s -= ctx_.n;
    }
    return MontgomeryValue(s);
}

} // namespace math
} // namespace modred
