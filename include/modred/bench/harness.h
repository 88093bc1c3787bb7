/**
 * @file harness.h
 * @brief Verification harness: run the same workload through every engine
 *
 * Workloads:
 * - Fold:          acc = x0; acc = acc * v_i for each multiplicand
 * - Pairwise:      out_i = x_i * y_i for independent pairs
 * - SumOfProducts: sum of x_i * y_i accumulated with modular addition
 *
 * The harness only computes and times; formatting lives in report.h.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_BENCH_HARNESS_H
#define MODRED_BENCH_HARNESS_H

#include "modred/math/naive.h"
#include "modred/math/montgomery.h"
#include "modred/math/barrett.h"

#include <gmpxx.h>
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace modred {
namespace bench {

using Clock = std::chrono::steady_clock;

enum class Workload {
    Fold,
    Pairwise,
    SumOfProducts
};

const char* workload_name(Workload workload);

// ============================================================================
// Engine adapters
// ============================================================================

/**
 * Every adapter exposes value_type, name(), to_domain(), from_domain(),
 * multiply(), add() and zero(). Naive and Barrett use the identity domain.
 */
class NaiveDomain {
public:
    using value_type = mpz_class;

    explicit NaiveDomain(const math::NaiveEngine& engine) : engine_(engine) {}

    static const char* name() { return "Naive"; }
    value_type to_domain(const mpz_class& x) const { return x; }
    mpz_class from_domain(const value_type& x) const { return x; }
    value_type multiply(const value_type& a, const value_type& b) const { return engine_.multiply(a, b); }
    value_type add(const value_type& a, const value_type& b) const { return engine_.add(a, b); }
    value_type zero() const { return 0; }

private:
    const math::NaiveEngine& engine_;
};

class MontgomeryDomain {
public:
    using value_type = math::MontgomeryValue;

    explicit MontgomeryDomain(const math::MontgomeryEngine& engine) : engine_(engine) {}

    static const char* name() { return "Montgomery"; }
    value_type to_domain(const mpz_class& x) const { return engine_.to_montgomery(x); }
    mpz_class from_domain(const value_type& x) const { return engine_.from_montgomery(x); }
    value_type multiply(const value_type& a, const value_type& b) const { return engine_.multiply(a, b); }
    value_type add(const value_type& a, const value_type& b) const { return engine_.add(a, b); }
    value_type zero() const { return engine_.to_montgomery(0); }

private:
    const math::MontgomeryEngine& engine_;
};

class BarrettDomain {
public:
    using value_type = mpz_class;

    explicit BarrettDomain(const math::BarrettEngine& engine) : engine_(engine) {}

    static const char* name() { return "Barrett"; }
    value_type to_domain(const mpz_class& x) const { return x; }
    mpz_class from_domain(const value_type& x) const { return x; }
    value_type multiply(const value_type& a, const value_type& b) const { return engine_.multiply(a, b); }
    value_type add(const value_type& a, const value_type& b) const { return engine_.add(a, b); }
    value_type zero() const { return 0; }

private:
    const math::BarrettEngine& engine_;
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Outputs and elapsed time of one engine on one workload
 *
 * Fold and SumOfProducts produce a single output; Pairwise one per pair.
 */
struct EngineRun {
    std::string engine;
    std::vector<mpz_class> outputs;
    Clock::duration elapsed{0};

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(elapsed).count();
    }
};

struct WorkloadReport {
    Workload workload = Workload::Fold;
    mpz_class modulus;
    size_t modulus_bits = 0;
    size_t operations = 0;
    EngineRun naive;
    EngineRun montgomery;
    EngineRun barrett;

    /** @brief True when Montgomery and Barrett outputs equal the naive outputs */
    bool agree() const;
};

// ============================================================================
// Per-engine workload runners
// ============================================================================

/**
 * @brief Fold multiplicands (already in the engine's domain) into x0
 *
 * Timed: conversion of x0, the multiplications, conversion of the result.
 */
template <class Domain>
EngineRun fold_through(const Domain& domain,
                       const mpz_class& x0,
                       const std::vector<typename Domain::value_type>& multiplicands)
{
    EngineRun run;
    run.engine = Domain::name();

    Clock::time_point start = Clock::now();
    typename Domain::value_type acc = domain.to_domain(x0);
    for (const auto& v : multiplicands) {
        acc = domain.multiply(acc, v);
    }
    mpz_class result = domain.from_domain(acc);
    run.elapsed = Clock::now() - start;

    run.outputs.push_back(std::move(result));
    return run;
}

template <class Domain>
EngineRun pairwise_through(const Domain& domain,
                           const std::vector<typename Domain::value_type>& xs,
                           const std::vector<typename Domain::value_type>& ys)
{
    EngineRun run;
    run.engine = Domain::name();
    run.outputs.reserve(xs.size());

    Clock::time_point start = Clock::now();
    for (size_t i = 0; i < xs.size(); ++i) {
        run.outputs.push_back(domain.from_domain(domain.multiply(xs[i], ys[i])));
    }
    run.elapsed = Clock::now() - start;

    return run;
}

template <class Domain>
EngineRun sum_of_products_through(const Domain& domain,
                                  const std::vector<typename Domain::value_type>& xs,
                                  const std::vector<typename Domain::value_type>& ys)
{
    EngineRun run;
    run.engine = Domain::name();

    Clock::time_point start = Clock::now();
    typename Domain::value_type acc = domain.zero();
    for (size_t i = 0; i < xs.size(); ++i) {
        acc = domain.add(acc, domain.multiply(xs[i], ys[i]));
    }
    mpz_class result = domain.from_domain(acc);
    run.elapsed = Clock::now() - start;

    run.outputs.push_back(std::move(result));
    return run;
}

/**
 * @brief Convert standard-form residues into the engine's domain (untimed)
 */
template <class Domain>
std::vector<typename Domain::value_type> to_domain_all(const Domain& domain,
                                                       const std::vector<mpz_class>& values)
{
    std::vector<typename Domain::value_type> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        out.push_back(domain.to_domain(v));
    }
    return out;
}

// ============================================================================
// Entry points
// ============================================================================

/**
 * @brief Fold x0 * v_1 * ... * v_m mod n through all three engines
 *
 * @throws modred::InvalidModulus if n is even or n <= 0
 * @throws std::out_of_range if x0 or any v_i is outside [0, n)
 */
WorkloadReport run_fold(const mpz_class& n,
                        const mpz_class& x0,
                        const std::vector<mpz_class>& multiplicands);

/**
 * @brief Reduce each x_i * y_i independently through all three engines
 * @throws std::invalid_argument if xs and ys differ in length
 */
WorkloadReport run_pairwise(const mpz_class& n,
                            const std::vector<mpz_class>& xs,
                            const std::vector<mpz_class>& ys);

/**
 * @brief Sum of x_i * y_i mod n through all three engines
 * @throws std::invalid_argument if xs and ys differ in length
 */
WorkloadReport run_sum_of_products(const mpz_class& n,
                                   const std::vector<mpz_class>& xs,
                                   const std::vector<mpz_class>& ys);

/**
 * @brief Throw unless every engine agrees with the naive oracle
 * @throws modred::ReductionMismatch naming the first disagreeing engine
 */
void check_agreement(const WorkloadReport& report);

/**
 * @brief run_fold followed by check_agreement
 */
WorkloadReport verify_fold(const mpz_class& n,
                           const mpz_class& x0,
                           const std::vector<mpz_class>& multiplicands);

} // namespace bench
} // namespace modred

#endif // MODRED_BENCH_HARNESS_H
