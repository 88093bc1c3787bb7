/**
 * @file test_modinv.cpp
 * @brief Extended Euclidean algorithm and modular inverse tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>

#include "modred/math/modinv.h"
#include "modred/core/error.h"

using modred::math::extended_gcd;
using modred::math::inverse_mod;

class ModInvTest : public ::testing::Test {};

TEST_F(ModInvTest, ExtendedGcdBezoutIdentity) {
    mpz_class a = 35, b = 15;
    auto eg = extended_gcd(a, b);

    EXPECT_EQ(eg.gcd, 5);
    EXPECT_EQ(mpz_class(a * eg.x + b * eg.y), eg.gcd);
}

TEST_F(ModInvTest, ExtendedGcdWithZero) {
    auto eg = extended_gcd(42, 0);
    EXPECT_EQ(eg.gcd, 42);
    EXPECT_EQ(eg.x, 1);
    EXPECT_EQ(eg.y, 0);
}

TEST_F(ModInvTest, SmallInverses) {
    EXPECT_EQ(inverse_mod(3, 11), 4);       // 3 * 4 = 12 = 1 mod 11
    EXPECT_EQ(inverse_mod(17, 3120), 2753); // RSA textbook example
    EXPECT_EQ(inverse_mod(1, 2), 1);
}

TEST_F(ModInvTest, InverseOfOddModPowerOfTwo) {
    // (1 - 2^32) * (1 + 2^32) = 1 - 2^64 = 1 mod 2^64
    mpz_class n("18446744069414584321");
    mpz_class r = 1;
    r <<= 64;

    mpz_class inv = inverse_mod(n, r);
    EXPECT_EQ(inv, mpz_class("4294967297"));
    EXPECT_EQ(mpz_class((n * inv) % r), 1);
}

TEST_F(ModInvTest, ResultIsCanonical) {
    mpz_class m("57896044618658097711785492504343953926634992332820282019728792003956564819949");
    for (unsigned long a : {2UL, 3UL, 12345UL, 987654321UL}) {
        mpz_class inv = inverse_mod(a, m);
        EXPECT_GE(inv, 0);
        EXPECT_LT(inv, m);
        EXPECT_EQ(mpz_class((a * inv) % m), 1);
    }
}

TEST_F(ModInvTest, ModulusOneGivesZero) {
    EXPECT_EQ(inverse_mod(5, 1), 0);
}

TEST_F(ModInvTest, NonCoprimeThrowsInverseNotFound) {
    EXPECT_THROW(inverse_mod(4, 8), modred::InverseNotFound);
    EXPECT_THROW(inverse_mod(6, 9), modred::InverseNotFound);
    EXPECT_THROW(inverse_mod(0, 7), modred::InverseNotFound);
}

TEST_F(ModInvTest, RejectsNonPositiveModulus) {
    EXPECT_THROW(inverse_mod(3, 0), std::invalid_argument);
    EXPECT_THROW(inverse_mod(3, -7), std::invalid_argument);
}

TEST_F(ModInvTest, InverseNotFoundCarriesErrorCode) {
    try {
        inverse_mod(10, 4);
        FAIL() << "expected InverseNotFound";
    } catch (const modred::InverseNotFound& e) {
        EXPECT_EQ(e.code(), MODRED_ERROR_INVERSE_NOT_FOUND);
    }
}
