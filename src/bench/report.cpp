/**
 * @file report.cpp
 * @brief Console formatting for harness results
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "modred/bench/report.h"

#include <iomanip>
#include <ostream>

namespace modred {
namespace bench {

void print_banner(std::ostream& os, const std::string& title) {
    os << "\n";
    os << "================================================================\n";
    os << "  " << title << "\n";
    os << "================================================================\n";
}

void print_modulus_header(std::ostream& os, const mpz_class& n) {
    os << "\n===== modulus " << n.get_str() << " ("
       << mpz_sizeinbase(n.get_mpz_t(), 2) << " bits) =====\n";
}

void print_context(std::ostream& os,
                   const math::MontgomeryEngine& mont,
                   const math::BarrettEngine& barrett) {
    os << "  k           = " << mont.num_bits() << "\n";
    os << "  R           = 2^" << mont.num_bits() << "\n";
    os << "  N'          = " << mont.n_prime().get_str() << "\n";
    os << "  R^2 mod N   = " << mont.r_squared().get_str() << "\n";
    os << "  mu          = " << barrett.mu().get_str() << "\n";
}

void print_engine_line(std::ostream& os, const EngineRun& run, size_t operations) {
    double ms = run.elapsed_ms();
    double ns_per_op = operations > 0
        ? (ms * 1.0e6) / static_cast<double>(operations)
        : 0.0;

    os << std::left << std::setw(25) << ("  " + run.engine)
       << std::right << std::fixed << std::setprecision(3)
       << std::setw(12) << ms << " ms"
       << std::setprecision(1)
       << std::setw(12) << ns_per_op << " ns/op"
       << std::endl;
}

void print_ratio(std::ostream& os, const EngineRun& run, const EngineRun& baseline) {
    double engine_ms = run.elapsed_ms();
    double naive_ms = baseline.elapsed_ms();

    if (engine_ms <= 0 || naive_ms <= 0) {
        os << std::left << std::setw(25) << ("  ==> " + run.engine)
           << "  (comparison not available)" << std::endl;
        return;
    }

    double ratio = naive_ms / engine_ms;
    const char* status = ratio >= 1.0 ? "FASTER" : "SLOWER";
    const char* symbol = ratio >= 1.0 ? "+" : "";
    double diff_percent = (ratio - 1.0) * 100.0;

    os << std::left << std::setw(25) << ("  ==> " + run.engine)
       << std::right << std::fixed << std::setprecision(2)
       << std::setw(12) << ratio << "x"
       << "    (" << symbol << std::setprecision(1) << diff_percent << "% "
       << status << " than naive)" << std::endl;
}

void print_report(std::ostream& os, const WorkloadReport& report) {
    os << "\n  [" << workload_name(report.workload) << "] "
       << report.operations << " multiplications\n";

    print_engine_line(os, report.naive, report.operations);
    print_engine_line(os, report.montgomery, report.operations);
    print_engine_line(os, report.barrett, report.operations);

    print_ratio(os, report.montgomery, report.naive);
    print_ratio(os, report.barrett, report.naive);

    if (report.workload != Workload::Pairwise && !report.naive.outputs.empty()) {
        os << "  result      = " << report.naive.outputs.front().get_str() << "\n";
    }
    os << "  agreement   = " << (report.agree() ? "OK" : "MISMATCH") << std::endl;
}

} // namespace bench
} // namespace modred
