/**
 * @file naive.cpp
 * @brief Reference modular arithmetic
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "modred/math/naive.h"
#include "modred/core/error.h"

namespace modred {
namespace math {

NaiveEngine::NaiveEngine(const mpz_class& n) : n_(n) {
    if (sgn(n) <= 0) {
        throw InvalidModulus("modulus must be positive, got " + n.get_str());
    }
}

mpz_class NaiveEngine::multiply(const mpz_class& a, const mpz_class& b) const {
    mpz_class r = a * b;
    r %= n_;
    return r;
}

mpz_class NaiveEngine::add(const mpz_class& a, const mpz_class& b) const {
    mpz_class r = a + b;
    r %= n_;
    return r;
}

} // namespace math
} // namespace modred
