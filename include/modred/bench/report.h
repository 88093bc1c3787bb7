/**
 * @file report.h
 * @brief Console formatting for harness results
 *
 * Unified output format for the CLI and the benchmark suite:
 * - per-engine time and per-operation cost
 * - engine vs naive ratio
 * - agreement verdict
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_BENCH_REPORT_H
#define MODRED_BENCH_REPORT_H

#include "modred/bench/harness.h"
#include "modred/math/montgomery.h"
#include "modred/math/barrett.h"

#include <iosfwd>
#include <string>

namespace modred {
namespace bench {

/**
 * @brief Boxed section title
 */
void print_banner(std::ostream& os, const std::string& title);

/**
 * @brief "===== modulus N (k bits) ====="
 */
void print_modulus_header(std::ostream& os, const mpz_class& n);

/**
 * @brief Derived Montgomery and Barrett constants for one modulus
 */
void print_context(std::ostream& os,
                   const math::MontgomeryEngine& mont,
                   const math::BarrettEngine& barrett);

/**
 * @brief Timing line for one engine
 */
void print_engine_line(std::ostream& os, const EngineRun& run, size_t operations);

/**
 * @brief Speed ratio of an engine against the naive baseline
 *
 * ratio = naive_time / engine_time; ratio > 1.0 means the engine is FASTER
 */
void print_ratio(std::ostream& os, const EngineRun& run, const EngineRun& baseline);

/**
 * @brief Full block for one workload report: engine lines, ratios, verdict
 */
void print_report(std::ostream& os, const WorkloadReport& report);

} // namespace bench
} // namespace modred

#endif // MODRED_BENCH_REPORT_H
