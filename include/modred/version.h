/**
 * @file version.h
 * @brief Unified Version Information for modred
 *
 * Single source of truth for version macros. Release bumps touch only
 * this file.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MODRED_VERSION_H
#define MODRED_VERSION_H

/** Major version number (API breaking changes) */
#define MODRED_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define MODRED_VERSION_MINOR 0

/** Patch version number (bug fixes) */
#define MODRED_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define MODRED_VERSION_STRING "1.0.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define MODRED_VERSION_NUMBER ((MODRED_VERSION_MAJOR * 10000) + \
                               (MODRED_VERSION_MINOR * 100) + \
                               MODRED_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define MODRED_RELEASE_DATE "2026-10-17"

/** Library name */
#define MODRED_LIBRARY_NAME "modred"

/** Full library description */
#define MODRED_DESCRIPTION "Division-free modular multiplication: Montgomery and Barrett"

/** Build type identifier */
#ifdef NDEBUG
#define MODRED_BUILD_TYPE "Release"
#else
#define MODRED_BUILD_TYPE "Debug"
#endif

#endif // MODRED_VERSION_H
