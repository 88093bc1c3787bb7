/**
 * @file cli_utils.h
 * @brief Common utility functions for modred CLI commands
 *
 * @author modred Development Team
 * @date 2026-10-17
 */

#ifndef MODRED_CLI_UTILS_H
#define MODRED_CLI_UTILS_H

#include "modred/core/common.h"
#include "modred/core/error.h"

#include <gmpxx.h>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace modred {
namespace cli {

/**
 * @brief Parse a non-negative integer in decimal or 0x-prefixed hex
 * @throws std::invalid_argument on malformed or negative input
 */
inline mpz_class parse_integer(const std::string& text) {
    std::string digits = text;
    int base = 10;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
        base = 16;
    }
    const char* allowed = (base == 16) ? "0123456789abcdefABCDEF" : "0123456789";
    if (digits.empty() || digits.find_first_not_of(allowed) != std::string::npos) {
        throw std::invalid_argument("Not a non-negative integer: '" + text + "'");
    }

    mpz_class value;
    if (value.set_str(digits, base) != 0) {
        throw std::invalid_argument("Not a non-negative integer: '" + text + "'");
    }
    return value;
}

/**
 * @brief Parse a comma-separated list of integers ("3,7,11")
 */
inline std::vector<mpz_class> parse_integer_list(const std::string& text) {
    std::vector<mpz_class> values;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (item.empty()) {
            continue;
        }
        values.push_back(parse_integer(item));
    }
    return values;
}

/**
 * @brief Parse a count such as --iterations
 */
inline size_t parse_count(const std::string& text) {
    mpz_class value = parse_integer(text);
    if (!value.fits_ulong_p()) {
        throw std::invalid_argument("Count out of range: '" + text + "'");
    }
    return static_cast<size_t>(value.get_ui());
}

/**
 * @brief Parse a random seed; it must fit in an unsigned long
 */
inline unsigned long parse_seed(const std::string& text) {
    mpz_class value = parse_integer(text);
    if (!value.fits_ulong_p()) {
        throw std::invalid_argument("Seed out of range: '" + text + "'");
    }
    return value.get_ui();
}

/**
 * @brief Fetch the value following an option, advancing the index
 */
inline std::string option_value(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for option ") + argv[i]);
    }
    return std::string(argv[++i]);
}

/**
 * @brief Locate an executable installed next to the running program
 *
 * Searches the directory of /proc/self/exe (where available), then the
 * directory part of program_path (argv[0] of main).
 *
 * @return Full path, or an empty string if not found
 */
inline std::string find_sibling_executable(const std::string& name,
                                           const std::string& program_path) {
    namespace fs = std::filesystem;

    std::vector<fs::path> dirs;
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        dirs.push_back(self.parent_path());
    }
    fs::path program(program_path);
    if (program.has_parent_path()) {
        dirs.push_back(program.parent_path());
    }

    for (const auto& dir : dirs) {
        fs::path candidate = dir / name;
#ifdef MODRED_PLATFORM_WINDOWS
        candidate += ".exe";
#endif
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return "";
}

/**
 * @brief Print "Error: ..." for a modred exception and map it to an exit code
 */
inline int exit_code_for(modred_error_t code, const std::exception& e) {
    std::cerr << "Error: " << modred_error_string(code) << ": " << e.what() << "\n";
    return -static_cast<int>(code);
}

/**
 * @brief Run a command body, turning exceptions into exit codes
 */
template <class Fn>
int run_guarded(Fn&& body) {
    try {
        return body();
    } catch (const InvalidModulus& e) {
        return exit_code_for(e.code(), e);
    } catch (const InverseNotFound& e) {
        return exit_code_for(e.code(), e);
    } catch (const ReductionMismatch& e) {
        return exit_code_for(e.code(), e);
    } catch (const std::invalid_argument& e) {
        return exit_code_for(MODRED_ERROR_INVALID_PARAM, e);
    } catch (const std::out_of_range& e) {
        return exit_code_for(MODRED_ERROR_INVALID_PARAM, e);
    } catch (const std::exception& e) {
        return exit_code_for(MODRED_ERROR_INTERNAL, e);
    }
}

} // namespace cli
} // namespace modred

#endif // MODRED_CLI_UTILS_H
