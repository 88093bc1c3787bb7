/**
 * @file cmd_verify.cpp
 * @brief verify subcommand: random cross-check of all engines
 *
 * Usage:
 *   modred verify [--modulus N]... [--iterations M] [--seed S] [--workload W]
 *
 * @author modred Development Team
 * @date 2026-10-17
 */

#include <iostream>
#include <string>

#include "modred/modred.h"
#include "cli_utils.h"

static void print_verify_help() {
    std::cout << "\nUsage: modred verify [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --modulus N      Odd modulus to test (repeatable; default: built-in list)\n";
    std::cout << "  --iterations M   Operations per workload (default: "
              << modred::bench::kDefaultIterations << ")\n";
    std::cout << "  --seed S         Random seed (default: clock)\n";
    std::cout << "  --workload W     all | fold | pairwise | sum (default: all)\n";
    std::cout << "  --verbose        Show derived constants per modulus\n";
    std::cout << "  --help           Show this help message\n\n";
}

int cmd_verify(int argc, char* argv[]) {
    return modred::cli::run_guarded([&]() -> int {
        modred::bench::SuiteConfig config = modred::bench::default_suite_config();
        bool custom_moduli = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--modulus" || arg == "-n") {
                if (!custom_moduli) {
                    config.moduli.clear();
                    custom_moduli = true;
                }
                config.moduli.push_back(
                    modred::cli::parse_integer(modred::cli::option_value(argc, argv, i)));
            } else if (arg == "--iterations" || arg == "-i") {
                config.iterations = modred::cli::parse_count(modred::cli::option_value(argc, argv, i));
            } else if (arg == "--seed") {
                config.seed = modred::cli::parse_seed(modred::cli::option_value(argc, argv, i));
            } else if (arg == "--workload" || arg == "-w") {
                std::string name = modred::cli::option_value(argc, argv, i);
                if (!modred::bench::parse_workloads(name, config.workloads)) {
                    std::cerr << "Unknown workload: " << name << "\n";
                    print_verify_help();
                    return 1;
                }
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_verify_help();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_verify_help();
                return 1;
            }
        }

        modred::bench::run_suite(config, std::cout);
        std::cout << "\nAll engines agree with the naive reduction.\n";
        return 0;
    });
}
