/**
 * @file modred_main.cpp
 * @brief modred Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   modred <command> [options]
 *
 * Commands:
 *   params       Show derived Montgomery and Barrett constants for a modulus
 *   mul          Fold a list of multiplicands through every engine
 *   verify       Cross-check all engines on random residues
 *   benchmark    Run the modred_benchmark suite
 *   version      Display version information
 *   help         Show help message
 *
 * @author modred Development Team
 * @date 2026-10-17
 * @copyright Apache License 2.0
 */

#include <iostream>
#include <string>
#include <algorithm>
#include <cctype>

#include "modred/modred.h"

// Subcommand handlers (forward declarations)
int cmd_params(int argc, char* argv[]);
int cmd_mul(int argc, char* argv[]);
int cmd_verify(int argc, char* argv[]);
int cmd_benchmark(int argc, char* argv[], const char* program_path);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: modred <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  params       Show Montgomery/Barrett constants for a modulus\n";
    std::cout << "  mul          Multiply a start value by a list of values mod N\n";
    std::cout << "  verify       Cross-check Montgomery and Barrett against naive reduction\n";
    std::cout << "  benchmark    Run the reduction benchmark suite\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  modred params --modulus 2013265921\n";
    std::cout << "  modred mul --modulus 2013265921 --x0 5 --values 3,7\n";
    std::cout << "  modred verify --iterations 10000 --seed 42\n";
    std::cout << "  modred benchmark\n\n";
    std::cout << "For command-specific help, use: modred <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << MODRED_LIBRARY_NAME << " - " << MODRED_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << modred_version()
              << " (" << MODRED_VERSION_NUMBER << ")\n";
    std::cout << "Build Date:   " << MODRED_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << MODRED_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << modred_platform() << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Reduction Engines:\n";
    std::cout << "  - Naive (multiply, then remainder)\n";
    std::cout << "  - Montgomery (REDC)\n";
    std::cout << "  - Barrett (shift-multiply-subtract)\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - GMP " << gmp_version << " (GNU Multiple Precision Arithmetic)\n";
    std::cout << "\n";
}

/**
 * @brief Display help message (alias for print_usage)
 */
void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command(argv[1]);

    // Case-insensitive command matching
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "params") {
        return cmd_params(argc - 1, argv + 1);
    }
    else if (command == "mul") {
        return cmd_mul(argc - 1, argv + 1);
    }
    else if (command == "verify") {
        return cmd_verify(argc - 1, argv + 1);
    }
    else if (command == "benchmark" || command == "bench") {
        return cmd_benchmark(argc - 1, argv + 1, argv[0]);
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    }
    else {
        std::cerr << "\nError: Unknown command '" << command << "'\n";
        print_usage();
        return 1;
    }
}
