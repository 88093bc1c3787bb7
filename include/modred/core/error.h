/**
 * @file error.h
 * @brief Exception types raised by the reduction engines and the harness
 *
 * Each exception carries the matching modred_error_t so command-line
 * front ends can turn it into an exit code.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_CORE_ERROR_H
#define MODRED_CORE_ERROR_H

#include "modred/core/common.h"
#include <stdexcept>
#include <string>

namespace modred {

/**
 * @brief Modulus rejected at engine construction (even or non-positive)
 */
class InvalidModulus : public std::invalid_argument {
public:
    explicit InvalidModulus(const std::string& what)
        : std::invalid_argument(what) {}

    modred_error_t code() const noexcept { return MODRED_ERROR_INVALID_MODULUS; }
};

/**
 * @brief No multiplicative inverse exists (gcd(a, m) != 1)
 */
class InverseNotFound : public std::domain_error {
public:
    explicit InverseNotFound(const std::string& what)
        : std::domain_error(what) {}

    modred_error_t code() const noexcept { return MODRED_ERROR_INVERSE_NOT_FOUND; }
};

/**
 * @brief A reduction engine produced a result different from the naive oracle
 */
class ReductionMismatch : public std::logic_error {
public:
    ReductionMismatch(const std::string& engine, const std::string& what)
        : std::logic_error(what), engine_(engine) {}

    const std::string& engine() const noexcept { return engine_; }
    modred_error_t code() const noexcept { return MODRED_ERROR_REDUCTION_MISMATCH; }

private:
    std::string engine_;
};

} // namespace modred

#endif // MODRED_CORE_ERROR_H
