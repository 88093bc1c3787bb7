/**
 * @file common.h
 * @brief Common definitions, error codes and export macros for modred
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef MODRED_CORE_COMMON_H
#define MODRED_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define MODRED_PLATFORM_WINDOWS 1
    #define MODRED_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define MODRED_PLATFORM_LINUX 1
    #define MODRED_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define MODRED_PLATFORM_MACOS 1
    #define MODRED_PLATFORM_NAME "macOS"
#else
    #define MODRED_PLATFORM_UNKNOWN 1
    #define MODRED_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef MODRED_PLATFORM_WINDOWS
    #ifdef MODRED_SHARED_LIBRARY
        #ifdef MODRED_BUILDING
            #define MODRED_API __declspec(dllexport)
        #else
            #define MODRED_API __declspec(dllimport)
        #endif
    #else
        #define MODRED_API
    #endif
#else
    #ifdef MODRED_SHARED_LIBRARY
        #define MODRED_API __attribute__((visibility("default")))
    #else
        #define MODRED_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    MODRED_SUCCESS = 0,
    MODRED_ERROR_INVALID_PARAM = -1,
    MODRED_ERROR_INVALID_MODULUS = -2,      // even or non-positive modulus
    MODRED_ERROR_INVERSE_NOT_FOUND = -3,    // gcd(a, m) != 1
    MODRED_ERROR_REDUCTION_MISMATCH = -4,   // engine disagrees with naive oracle
    MODRED_ERROR_INTERNAL = -10
} modred_error_t;

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
MODRED_API const char* modred_error_string(modred_error_t error);

/**
 * @brief Library version string ("major.minor.patch")
 */
MODRED_API const char* modred_version(void);

/**
 * @brief Name of the platform the library was built for
 */
MODRED_API const char* modred_platform(void);

#ifdef __cplusplus
}
#endif

#endif // MODRED_CORE_COMMON_H
