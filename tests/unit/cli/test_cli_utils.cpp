/**
 * @file test_cli_utils.cpp
 * @brief Command-line parsing helper tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_utils.h"

using namespace modred::cli;

TEST(CliUtilsTest, ParseDecimal) {
    EXPECT_EQ(parse_integer("0"), 0);
    EXPECT_EQ(parse_integer("2013265921"), mpz_class("2013265921"));
    EXPECT_EQ(parse_integer("57896044618658097711785492504343953926634992332820282019728792003956564819949"),
              mpz_class("57896044618658097711785492504343953926634992332820282019728792003956564819949"));
}

TEST(CliUtilsTest, ParseHex) {
    EXPECT_EQ(parse_integer("0x78000001"), mpz_class("2013265921"));
    EXPECT_EQ(parse_integer("0XFFFFFFFF00000001"), mpz_class("18446744069414584321"));
}

TEST(CliUtilsTest, ParseRejectsMalformed) {
    EXPECT_THROW(parse_integer(""), std::invalid_argument);
    EXPECT_THROW(parse_integer("-5"), std::invalid_argument);
    EXPECT_THROW(parse_integer("+5"), std::invalid_argument);
    EXPECT_THROW(parse_integer("12abc"), std::invalid_argument);
    EXPECT_THROW(parse_integer("0x"), std::invalid_argument);
    EXPECT_THROW(parse_integer("0xZZ"), std::invalid_argument);
}

TEST(CliUtilsTest, ParseRejectsEmbeddedWhitespace) {
    EXPECT_THROW(parse_integer("1 2"), std::invalid_argument);
    EXPECT_THROW(parse_integer(" 12"), std::invalid_argument);
    EXPECT_THROW(parse_integer("12\t"), std::invalid_argument);
    EXPECT_THROW(parse_integer("0x1 F"), std::invalid_argument);
    EXPECT_THROW(parse_integer_list("3, 7"), std::invalid_argument);
}

TEST(CliUtilsTest, ParseList) {
    std::vector<mpz_class> values = parse_integer_list("3,7,0x10");
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], 3);
    EXPECT_EQ(values[1], 7);
    EXPECT_EQ(values[2], 16);

    EXPECT_TRUE(parse_integer_list("").empty());
    EXPECT_EQ(parse_integer_list("5,,6").size(), 2u);
    EXPECT_THROW(parse_integer_list("1,x"), std::invalid_argument);
}

TEST(CliUtilsTest, ParseCount) {
    EXPECT_EQ(parse_count("1000"), 1000u);
    EXPECT_THROW(parse_count("340282366920938463463374607431768211507"), std::invalid_argument);
}

TEST(CliUtilsTest, ParseSeed) {
    EXPECT_EQ(parse_seed("42"), 42ul);
    EXPECT_EQ(parse_seed("0x10"), 16ul);
    EXPECT_THROW(parse_seed("340282366920938463463374607431768211507"), std::invalid_argument);
    EXPECT_THROW(parse_seed("-1"), std::invalid_argument);
}

TEST(CliUtilsTest, OptionValue) {
    char arg0[] = "mul";
    char arg1[] = "--modulus";
    char arg2[] = "13";
    char* argv[] = {arg0, arg1, arg2};

    int i = 1;
    EXPECT_EQ(option_value(3, argv, i), "13");
    EXPECT_EQ(i, 2);

    int last = 2;
    EXPECT_THROW(option_value(3, argv, last), std::invalid_argument);
}

TEST(CliUtilsTest, RunGuardedMapsErrorsToExitCodes) {
    EXPECT_EQ(run_guarded([] { return 0; }), 0);
    EXPECT_EQ(run_guarded([]() -> int { throw modred::InvalidModulus("even"); }),
              -static_cast<int>(MODRED_ERROR_INVALID_MODULUS));
    EXPECT_EQ(run_guarded([]() -> int { throw modred::ReductionMismatch("Barrett", "x"); }),
              -static_cast<int>(MODRED_ERROR_REDUCTION_MISMATCH));
    EXPECT_EQ(run_guarded([]() -> int { throw std::invalid_argument("bad"); }),
              -static_cast<int>(MODRED_ERROR_INVALID_PARAM));
    EXPECT_EQ(run_guarded([]() -> int { throw std::runtime_error("io"); }),
              -static_cast<int>(MODRED_ERROR_INTERNAL));
}

TEST(CliUtilsTest, FindSiblingExecutableNextToProgramPath) {
    namespace fs = std::filesystem;

    fs::path dir = fs::temp_directory_path() / "modred_cli_lookup_test";
    fs::create_directories(dir);
    fs::path target = dir / "modred_lookup_target";
#ifdef MODRED_PLATFORM_WINDOWS
    target += ".exe";
#endif
    std::ofstream(target.string()) << "#!/bin/sh\n";

    std::string program = (dir / "modred").string();
    EXPECT_EQ(find_sibling_executable("modred_lookup_target", program), target.string());
    EXPECT_EQ(find_sibling_executable("modred_lookup_missing", program), "");
    EXPECT_EQ(find_sibling_executable("modred_lookup_target", "modred"), "");

    fs::remove_all(dir);
}
