/**
 * @file cmd_mul.cpp
 * @brief mul subcommand: fold explicit multiplicands through every engine
 *
 * Usage:
 *   modred mul --modulus N --x0 X --values v1,v2,...
 *
 * Prints the result once all engines agree; exits non-zero otherwise.
 *
 * @author modred Development Team
 * @date 2026-10-17
 */

#include <iostream>
#include <string>
#include <vector>

#include "modred/modred.h"
#include "cli_utils.h"

static void print_mul_help() {
    std::cout << "\nUsage: modred mul --modulus N --x0 X [--values v1,v2,...] [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --modulus N      Odd modulus (decimal or 0x-prefixed hex)\n";
    std::cout << "  --x0 X           Start value in [0, N)\n";
    std::cout << "  --values LIST    Comma-separated multiplicands in [0, N)\n";
    std::cout << "  --verbose        Show per-engine timing\n";
    std::cout << "  --help           Show this help message\n\n";
}

int cmd_mul(int argc, char* argv[]) {
    return modred::cli::run_guarded([&]() -> int {
        std::string modulus_text;
        std::string x0_text;
        std::string values_text;
        bool verbose = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--modulus" || arg == "-n") {
                modulus_text = modred::cli::option_value(argc, argv, i);
            } else if (arg == "--x0") {
                x0_text = modred::cli::option_value(argc, argv, i);
            } else if (arg == "--values") {
                values_text = modred::cli::option_value(argc, argv, i);
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_mul_help();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_mul_help();
                return 1;
            }
        }

        if (modulus_text.empty() || x0_text.empty()) {
            std::cerr << "Error: --modulus and --x0 are required\n";
            print_mul_help();
            return 1;
        }

        mpz_class n = modred::cli::parse_integer(modulus_text);
        mpz_class x0 = modred::cli::parse_integer(x0_text);
        std::vector<mpz_class> values = modred::cli::parse_integer_list(values_text);

        modred::bench::WorkloadReport report = modred::bench::verify_fold(n, x0, values);

        if (verbose) {
            modred::bench::print_modulus_header(std::cout, n);
            modred::bench::print_report(std::cout, report);
        } else {
            std::cout << report.naive.outputs.front().get_str() << "\n";
        }
        return 0;
    });
}
