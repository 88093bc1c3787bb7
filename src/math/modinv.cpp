/**
 * @file modinv.cpp
 * @brief Extended Euclidean algorithm and modular inverse
 *
 * Iterative form tracking both Bezout coefficients:
 *   (old_r, r) <- (r, old_r - q*r)
 *   (old_s, s) <- (s, old_s - q*s)
 *   (old_t, t) <- (t, old_t - q*t)
 * until r == 0; old_r is then the gcd.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "modred/math/modinv.h"
#include "modred/core/error.h"
#include <stdexcept>
#include <utility>

namespace modred {
namespace math {

ExtendedGcd extended_gcd(const mpz_class& a, const mpz_class& b) {
    if (sgn(a) < 0 || sgn(b) < 0) {
        throw std::invalid_argument("extended_gcd requires non-negative operands");
    }

    mpz_class old_r = a, r = b;
    mpz_class old_s = 1, s = 0;
    mpz_class old_t = 0, t = 1;
    mpz_class q, tmp;

    while (r != 0) {
        mpz_fdiv_q(q.get_mpz_t(), old_r.get_mpz_t(), r.get_mpz_t());

        tmp = old_r - q * r;
        old_r = std::move(r);
        r = std::move(tmp);

        tmp = old_s - q * s;
        old_s = std::move(s);
        s = std::move(tmp);

        tmp = old_t - q * t;
        old_t = std::move(t);
        t = std::move(tmp);
    }

    return ExtendedGcd{old_r, old_s, old_t};
}

mpz_class inverse_mod(const mpz_class& a, const mpz_class& m) {
    if (sgn(m) <= 0) {
        throw std::invalid_argument("inverse_mod requires a positive modulus");
    }
    if (sgn(a) < 0) {
        throw std::invalid_argument("inverse_mod requires a non-negative value");
    }
    if (m == 1) {
        return 0;
    }

    ExtendedGcd eg = extended_gcd(a, m);
    if (eg.gcd != 1) {
        throw InverseNotFound("modular inverse of " + a.get_str() +
                              " mod " + m.get_str() + " does not exist (gcd = " +
                              eg.gcd.get_str() + ")");
    }

    // Bring the coefficient into [0, m)
    mpz_class x;
    mpz_fdiv_r(x.get_mpz_t(), eg.x.get_mpz_t(), m.get_mpz_t());
    return x;
}

} // namespace math
} // namespace modred
