/**
 * @file cmd_benchmark.cpp
 * @brief Benchmark subcommand implementation for modred CLI
 *
 * Runs the modred_benchmark executable shipped next to the CLI.
 *
 * Usage:
 *   modred benchmark [workload]
 *
 * @author modred Development Team
 * @date 2026-10-17
 */

#include <iostream>
#include <string>
#include <cstdlib>

#include "cli_utils.h"

/**
 * @brief Print benchmark subcommand help
 */
void print_benchmark_help() {
    std::cout << "\nUsage: modred benchmark [workload]\n\n";
    std::cout << "Workloads:\n";
    std::cout << "  all        Every workload (default)\n";
    std::cout << "  fold       x0 * v1 * ... * vm mod N\n";
    std::cout << "  pairwise   Independent products x_i * y_i mod N\n";
    std::cout << "  sum        Sum of products x_i * y_i mod N\n\n";
    std::cout << "Description:\n";
    std::cout << "  Times Montgomery and Barrett reduction against naive\n";
    std::cout << "  multiply-then-remainder for moduli from 31 to 255 bits,\n";
    std::cout << "  verifying every result against the naive reduction.\n\n";
}

/**
 * @brief Benchmark subcommand handler
 */
int cmd_benchmark(int argc, char* argv[], const char* program_path) {
    std::string workload = "all";

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_benchmark_help();
            return 0;
        } else if (arg == "all" || arg == "fold" || arg == "pairwise" || arg == "sum") {
            workload = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_benchmark_help();
            return 1;
        }
    }

    std::string benchmark_exe =
        modred::cli::find_sibling_executable("modred_benchmark", program_path ? program_path : "");
    if (benchmark_exe.empty()) {
        std::cerr << "Error: Benchmark executable not found\n";
        std::cerr << "Make sure modred_benchmark is in the same directory as modred\n";
        return 1;
    }

    std::string command = "\"" + benchmark_exe + "\" " + workload;
    return std::system(command.c_str()) == 0 ? 0 : 1;
}
