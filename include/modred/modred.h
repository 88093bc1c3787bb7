/**
 * @file modred.h
 * @brief modred - Division-free modular multiplication
 *
 * Unified header for the reduction engines and the verification harness.
 *
 * Modules:
 * - Core: error codes, exceptions, version
 * - Math: NaiveEngine, MontgomeryEngine, BarrettEngine, inverse_mod
 * - Bench: harness, report formatting, suite driver
 * - Utils: ResidueSampler
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MODRED_H
#define MODRED_H

#include "modred/version.h"
#include "modred/core/common.h"
#include "modred/core/error.h"

#include "modred/math/modinv.h"
#include "modred/math/naive.h"
#include "modred/math/montgomery.h"
#include "modred/math/barrett.h"

#include "modred/bench/harness.h"
#include "modred/bench/report.h"
#include "modred/bench/suite.h"

#include "modred/utils/random.h"

#endif // MODRED_H
