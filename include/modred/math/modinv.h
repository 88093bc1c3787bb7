/**
 * @file modinv.h
 * @brief Extended Euclidean algorithm and modular inverse over GMP integers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_MATH_MODINV_H
#define MODRED_MATH_MODINV_H

#include <gmpxx.h>

namespace modred {
namespace math {

/**
 * @brief Result of the extended Euclidean algorithm
 *
 * a * x + b * y == gcd
 */
struct ExtendedGcd {
    mpz_class gcd;
    mpz_class x;    ///< Bezout coefficient of a
    mpz_class y;    ///< Bezout coefficient of b
};

/**
 * @brief Extended Euclidean algorithm on non-negative integers
 * @throws std::invalid_argument if a or b is negative
 */
ExtendedGcd extended_gcd(const mpz_class& a, const mpz_class& b);

/**
 * @brief Modular inverse: x in [0, m) with a * x == 1 (mod m)
 *
 * @param a Value to invert (any non-negative integer)
 * @param m Modulus (m > 0); for m == 1 the result is 0
 * @throws std::invalid_argument if m <= 0 or a < 0
 * @throws modred::InverseNotFound if gcd(a, m) != 1
 */
mpz_class inverse_mod(const mpz_class& a, const mpz_class& m);

} // namespace math
} // namespace modred

#endif // MODRED_MATH_MODINV_H
