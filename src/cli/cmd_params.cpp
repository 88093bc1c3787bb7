/**
 * @file cmd_params.cpp
 * @brief params subcommand: show the derived reduction constants
 *
 * Usage:
 *   modred params --modulus N [--barrett-only]
 *
 * @author modred Development Team
 * @date 2026-10-17
 */

#include <iostream>
#include <string>

#include "modred/modred.h"
#include "cli_utils.h"

/**
 * @brief Print params subcommand help
 */
static void print_params_help() {
    std::cout << "\nUsage: modred params --modulus N [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --modulus N      Modulus (decimal or 0x-prefixed hex)\n";
    std::cout << "  --barrett-only   Skip Montgomery constants (allows even N)\n";
    std::cout << "  --help           Show this help message\n\n";
}

/**
 * @brief params subcommand handler
 */
int cmd_params(int argc, char* argv[]) {
    return modred::cli::run_guarded([&]() -> int {
        std::string modulus_text;
        bool barrett_only = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--modulus" || arg == "-n") {
                modulus_text = modred::cli::option_value(argc, argv, i);
            } else if (arg == "--barrett-only") {
                barrett_only = true;
            } else if (arg == "--help" || arg == "-h") {
                print_params_help();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_params_help();
                return 1;
            }
        }

        if (modulus_text.empty()) {
            std::cerr << "Error: --modulus is required\n";
            print_params_help();
            return 1;
        }

        mpz_class n = modred::cli::parse_integer(modulus_text);
        modred::math::BarrettEngine barrett(n);

        modred::bench::print_modulus_header(std::cout, n);
        if (barrett_only) {
            std::cout << "  k           = " << barrett.num_bits() << "\n";
            std::cout << "  mu          = " << barrett.mu().get_str() << "\n";
            return 0;
        }

        modred::math::MontgomeryEngine mont(n);
        modred::bench::print_context(std::cout, mont, barrett);
        return 0;
    });
}
