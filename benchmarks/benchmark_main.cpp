/**
 * @file benchmark_main.cpp
 * @brief Montgomery / Barrett vs naive reduction benchmark suite
 *
 * Usage:
 *   modred_benchmark [workload] [--iterations N] [--seed S] [--verbose]
 *
 * Workloads:
 *   all       - Run all workloads (default)
 *   fold      - x0 * v1 * ... * vm mod N
 *   pairwise  - Independent products x_i * y_i mod N
 *   sum       - Sum of products x_i * y_i mod N
 *
 * Every run is checked against the naive reduction; a mismatch aborts the
 * suite with a non-zero exit code.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "modred/modred.h"
#include "benchmark_common.hpp"

static void print_usage() {
    std::cout << "\nUsage: modred_benchmark [all|fold|pairwise|sum] [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --iterations N   Operations per workload (default: "
              << modred::bench::kDefaultIterations << ")\n";
    std::cout << "  --seed S         Random seed (default: clock)\n";
    std::cout << "  --verbose        Show derived constants per modulus\n\n";
}

static bool parse_option_number(const char* option, const char* text, unsigned long& value) {
    if (!modred::bench::parse_unsigned(text, value)) {
        std::cerr << "Invalid value for " << option << ": " << text << "\n";
        print_usage();
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    modred::bench::SuiteConfig config = modred::bench::default_suite_config();

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if ((arg == "--iterations" || arg == "-i") && i + 1 < argc) {
            unsigned long iterations = 0;
            if (!parse_option_number("--iterations", argv[++i], iterations)) {
                return 1;
            }
            config.iterations = iterations;
        } else if (arg == "--seed" && i + 1 < argc) {
            if (!parse_option_number("--seed", argv[++i], config.seed)) {
                return 1;
            }
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (!modred::bench::parse_workloads(arg, config.workloads)) {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    modred::bench::print_banner(std::cout,
        std::string("modred ") + MODRED_VERSION_STRING +
        " - Montgomery / Barrett vs naive reduction");

    try {
        std::vector<modred::bench::WorkloadReport> reports =
            modred::bench::run_suite(config, std::cout);
        modred_bench::print_summary(reports);
    } catch (const modred::ReductionMismatch& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return -static_cast<int>(e.code());
    } catch (const modred::InvalidModulus& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return -static_cast<int>(e.code());
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nAll engines agree with the naive reduction.\n";
    return 0;
}
