/**
 * @file barrett.cpp
 * @brief Barrett reduction
 *
 * With k = bitlength(n) and mu = floor(4^k / n), for 0 <= x < n^2:
 *   q = floor(floor(x / 2^k) * mu / 2^k)
 *   floor(x / n) - 2 <= q <= floor(x / n)
 * so r = x - q*n lies in [0, 3n) and at most two subtractions follow.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "modred/math/barrett.h"
#include "modred/core/error.h"

namespace modred {
namespace math {

BarrettEngine::BarrettEngine(const mpz_class& n) {
    if (sgn(n) <= 0) {
        throw InvalidModulus("Barrett modulus must be positive, got " + n.get_str());
    }

    ctx_.n = n;
    ctx_.k = mpz_sizeinbase(n.get_mpz_t(), 2);

    // mu = floor(2^(2k) / n)
    mpz_class pow2 = 1;
    pow2 <<= 2 * ctx_.k;
    ctx_.mu = pow2 / n;
}

mpz_class BarrettEngine::reduce(const mpz_class& x) const {
    mpz_class q = x >> ctx_.k;
    q *= ctx_.mu;
    q >>= ctx_.k;

    mpz_class r = x - q * ctx_.n;
    while (r >= ctx_.n) {
        r -= ctx_.n;
    }
    return r;
}

mpz_class BarrettEngine::multiply(const mpz_class& a, const mpz_class& b) const {
    return reduce(a * b);
}

mpz_class BarrettEngine::add(const mpz_class& a, const mpz_class& b) const {
    return reduce(a + b);
}

} // namespace math
} // namespace modred
