/**
 * @file export.cpp
 * @brief Library-level C entry points: version, platform, error strings
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "modred/core/common.h"
#include "modred/version.h"

extern "C" {

const char* modred_version(void) {
    return MODRED_VERSION_STRING;
}

const char* modred_platform(void) {
    return MODRED_PLATFORM_NAME;
}

const char* modred_error_string(modred_error_t error) {
    switch (error) {
        case MODRED_SUCCESS:
            return "Success";
        case MODRED_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case MODRED_ERROR_INVALID_MODULUS:
            return "Invalid modulus";
        case MODRED_ERROR_INVERSE_NOT_FOUND:
            return "Modular inverse does not exist";
        case MODRED_ERROR_REDUCTION_MISMATCH:
            return "Reduction result mismatches naive reduction";
        case MODRED_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

} // extern "C"
