/**
 * @file benchmark_common.hpp
 * @brief Summary table for the modred benchmark suite
 *
 * One row per (modulus, workload) with the time of each engine and its
 * ratio against the naive baseline:
 *   ratio = naive_time / engine_time
 *   ratio > 1.0 means the engine is FASTER
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_BENCHMARK_COMMON_HPP
#define MODRED_BENCHMARK_COMMON_HPP

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include "modred/bench/harness.h"

namespace modred_bench {

/**
 * @brief naive_ms / engine_ms, or 0 when either time is not measurable
 */
inline double speedup(double engine_ms, double naive_ms) {
    if (engine_ms <= 0 || naive_ms <= 0) {
        return 0.0;
    }
    return naive_ms / engine_ms;
}

inline void print_summary_header() {
    std::cout << "\n" << std::left
              << std::setw(8) << "Bits"
              << std::setw(10) << "Workload"
              << std::right
              << std::setw(12) << "Naive ms"
              << std::setw(12) << "Mont ms"
              << std::setw(12) << "Barrett ms"
              << std::setw(10) << "Mont x"
              << std::setw(10) << "Barr x"
              << std::endl;
    std::cout << std::string(74, '-') << std::endl;
}

inline void print_summary_row(const modred::bench::WorkloadReport& report) {
    double naive_ms = report.naive.elapsed_ms();
    double mont_ms = report.montgomery.elapsed_ms();
    double barrett_ms = report.barrett.elapsed_ms();

    std::cout << std::left
              << std::setw(8) << report.modulus_bits
              << std::setw(10) << modred::bench::workload_name(report.workload)
              << std::right << std::fixed << std::setprecision(3)
              << std::setw(12) << naive_ms
              << std::setw(12) << mont_ms
              << std::setw(12) << barrett_ms
              << std::setprecision(2)
              << std::setw(9) << speedup(mont_ms, naive_ms) << "x"
              << std::setw(9) << speedup(barrett_ms, naive_ms) << "x"
              << std::endl;
}

inline void print_summary(const std::vector<modred::bench::WorkloadReport>& reports) {
    print_summary_header();
    for (const auto& report : reports) {
        print_summary_row(report);
    }
}

} // namespace modred_bench

#endif // MODRED_BENCHMARK_COMMON_HPP
