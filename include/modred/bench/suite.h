/**
 * @file suite.h
 * @brief Benchmark suite configuration and driver
 *
 * Samples random residues per modulus, runs the selected workloads,
 * prints each report and verifies agreement with the naive oracle.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_BENCH_SUITE_H
#define MODRED_BENCH_SUITE_H

#include "modred/bench/harness.h"

#include <gmpxx.h>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace modred {
namespace bench {

/** Operations per modulus and workload unless overridden */
constexpr size_t kDefaultIterations = 1000;

/** Upper bound on operations per workload; samples are held in memory */
constexpr size_t kMaxIterations = 100000000;

struct SuiteConfig {
    std::vector<mpz_class> moduli;
    size_t iterations = kDefaultIterations;
    unsigned long seed = 0;
    std::vector<Workload> workloads;
    bool verbose = false;
};

/**
 * @brief Default moduli, 31 to 255 bits:
 * - 2013265921 (BabyBear, 31 bits)
 * - 2^64 - 2^32 + 1 (64 bits)
 * - 2^127 - 1 (127 bits, just below 2^128)
 * - 2^128 + 51 (129 bits, just above 2^128)
 * - 2^255 - 19 (255 bits)
 */
std::vector<mpz_class> default_moduli();

/**
 * @brief All workloads, default moduli, default iterations, clock seed
 */
SuiteConfig default_suite_config();

/**
 * @brief Parse "all", "fold", "pairwise" or "sum"
 * @return false if the name is unknown (workloads untouched)
 */
bool parse_workloads(const std::string& name, std::vector<Workload>& workloads);

/**
 * @brief Parse a decimal unsigned number such as --iterations or --seed
 * @return false on empty input, a sign, non-digits or overflow (value untouched)
 */
bool parse_unsigned(const std::string& text, unsigned long& value);

/**
 * @brief Run every workload on every modulus, printing as it goes
 *
 * @throws std::invalid_argument if config.iterations exceeds kMaxIterations
 * @throws modred::InvalidModulus for an even or non-positive modulus
 * @throws modred::ReductionMismatch on the first disagreement
 */
std::vector<WorkloadReport> run_suite(const SuiteConfig& config, std::ostream& os);

} // namespace bench
} // namespace modred

#endif // MODRED_BENCH_SUITE_H
