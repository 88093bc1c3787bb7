/**
 * @file harness.cpp
 * @brief Verification harness for the reduction engines
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "modred/bench/harness.h"
#include "modred/core/error.h"

#include <sstream>
#include <stdexcept>

namespace modred {
namespace bench {

const char* workload_name(Workload workload) {
    switch (workload) {
        case Workload::Fold:
            return "fold";
        case Workload::Pairwise:
            return "pairwise";
        case Workload::SumOfProducts:
            return "sum";
        default:
            return "unknown";
    }
}

bool WorkloadReport::agree() const {
    return montgomery.outputs == naive.outputs && barrett.outputs == naive.outputs;
}

// ============================================================================
// Input validation
// ============================================================================

static void require_residue(const mpz_class& v, const mpz_class& n, const char* what) {
    if (sgn(v) < 0 || v >= n) {
        throw std::out_of_range(std::string(what) + " " + v.get_str() +
                                " is not a residue in [0, " + n.get_str() + ")");
    }
}

static void require_residues(const std::vector<mpz_class>& values,
                             const mpz_class& n,
                             const char* what) {
    for (const auto& v : values) {
        require_residue(v, n, what);
    }
}

static void require_same_length(const std::vector<mpz_class>& xs,
                                const std::vector<mpz_class>& ys) {
    if (xs.size() != ys.size()) {
        throw std::invalid_argument("operand vectors must have the same length");
    }
}

static WorkloadReport make_report(Workload workload, const mpz_class& n, size_t operations) {
    WorkloadReport report;
    report.workload = workload;
    report.modulus = n;
    report.modulus_bits = mpz_sizeinbase(n.get_mpz_t(), 2);
    report.operations = operations;
    return report;
}

// ============================================================================
// Entry points
// ============================================================================

WorkloadReport run_fold(const mpz_class& n,
                        const mpz_class& x0,
                        const std::vector<mpz_class>& multiplicands)
{
    // Engines first: an invalid modulus is reported before residue checks
    math::NaiveEngine naive(n);
    math::MontgomeryEngine mont(n);
    math::BarrettEngine barrett(n);

    require_residue(x0, n, "start value");
    require_residues(multiplicands, n, "multiplicand");

    WorkloadReport report = make_report(Workload::Fold, n, multiplicands.size());

    NaiveDomain naive_domain(naive);
    report.naive = fold_through(naive_domain, x0, multiplicands);

    // Montgomery operands are converted ahead of the timed loop
    MontgomeryDomain mont_domain(mont);
    auto mont_values = to_domain_all(mont_domain, multiplicands);
    report.montgomery = fold_through(mont_domain, x0, mont_values);

    BarrettDomain barrett_domain(barrett);
    report.barrett = fold_through(barrett_domain, x0, multiplicands);

    return report;
}

WorkloadReport run_pairwise(const mpz_class& n,
                            const std::vector<mpz_class>& xs,
                            const std::vector<mpz_class>& ys)
{
    math::NaiveEngine naive(n);
    math::MontgomeryEngine mont(n);
    math::BarrettEngine barrett(n);

    require_same_length(xs, ys);
    require_residues(xs, n, "operand");
    require_residues(ys, n, "operand");

    WorkloadReport report = make_report(Workload::Pairwise, n, xs.size());

    NaiveDomain naive_domain(naive);
    report.naive = pairwise_through(naive_domain, xs, ys);

    MontgomeryDomain mont_domain(mont);
    auto mont_xs = to_domain_all(mont_domain, xs);
    auto mont_ys = to_domain_all(mont_domain, ys);
    report.montgomery = pairwise_through(mont_domain, mont_xs, mont_ys);

    BarrettDomain barrett_domain(barrett);
    report.barrett = pairwise_through(barrett_domain, xs, ys);

    return report;
}

WorkloadReport run_sum_of_products(const mpz_class& n,
                                   const std::vector<mpz_class>& xs,
                                   const std::vector<mpz_class>& ys)
{
    math::NaiveEngine naive(n);
    math::MontgomeryEngine mont(n);
    math::BarrettEngine barrett(n);

    require_same_length(xs, ys);
    require_residues(xs, n, "operand");
    require_residues(ys, n, "operand");

    WorkloadReport report = make_report(Workload::SumOfProducts, n, xs.size());

    NaiveDomain naive_domain(naive);
    report.naive = sum_of_products_through(naive_domain, xs, ys);

    MontgomeryDomain mont_domain(mont);
    auto mont_xs = to_domain_all(mont_domain, xs);
    auto mont_ys = to_domain_all(mont_domain, ys);
    report.montgomery = sum_of_products_through(mont_domain, mont_xs, mont_ys);

    BarrettDomain barrett_domain(barrett);
    report.barrett = sum_of_products_through(barrett_domain, xs, ys);

    return report;
}

static void check_engine(const WorkloadReport& report, const EngineRun& run) {
    const std::vector<mpz_class>& expected = report.naive.outputs;

    if (run.outputs.size() != expected.size()) {
        std::ostringstream oss;
        oss << run.engine << " produced " << run.outputs.size() << " outputs, expected "
            << expected.size() << " (" << workload_name(report.workload)
            << ", modulus " << report.modulus.get_str() << ")";
        throw ReductionMismatch(run.engine, oss.str());
    }

    for (size_t i = 0; i < expected.size(); ++i) {
        if (run.outputs[i] != expected[i]) {
            std::ostringstream oss;
            oss << run.engine << " reduction mismatches naive reduction ("
                << workload_name(report.workload) << ", modulus "
                << report.modulus.get_str() << ", index " << i << "): got "
                << run.outputs[i].get_str() << ", expected " << expected[i].get_str();
            throw ReductionMismatch(run.engine, oss.str());
        }
    }
}

void check_agreement(const WorkloadReport& report) {
    check_engine(report, report.montgomery);
    check_engine(report, report.barrett);
}

WorkloadReport verify_fold(const mpz_class& n,
                           const mpz_class& x0,
                           const std::vector<mpz_class>& multiplicands)
{
    WorkloadReport report = run_fold(n, x0, multiplicands);
    check_agreement(report);
    return report;
}

} // namespace bench
} // namespace modred
