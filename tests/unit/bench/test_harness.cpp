/**
 * @file test_harness.cpp
 * @brief Fold / pairwise / sum-of-products harness tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "modred/bench/harness.h"
#include "modred/core/error.h"
#include "modred/utils/random.h"

using namespace modred::bench;

namespace {

const mpz_class kBabyBear("2013265921");
const mpz_class kGoldilocks("18446744069414584321");

} // namespace

class HarnessTest : public ::testing::Test {
protected:
    modred::utils::ResidueSampler sampler_{42UL};
};

// ============================================================================
// Fold
// ============================================================================

TEST_F(HarnessTest, FoldSmallScenario) {
    WorkloadReport report = verify_fold(kBabyBear, 5, {3, 7});

    ASSERT_EQ(report.naive.outputs.size(), 1u);
    EXPECT_EQ(report.naive.outputs[0], 105);
    EXPECT_EQ(report.montgomery.outputs[0], 105);
    EXPECT_EQ(report.barrett.outputs[0], 105);
    EXPECT_EQ(report.operations, 2u);
    EXPECT_EQ(report.modulus_bits, 31u);
    EXPECT_EQ(report.workload, Workload::Fold);
}

TEST_F(HarnessTest, FoldByMinusOne) {
    mpz_class minus_one = kGoldilocks - 1;
    WorkloadReport report = verify_fold(kGoldilocks, 1, {minus_one});

    EXPECT_EQ(report.naive.outputs[0], minus_one);
    EXPECT_EQ(report.montgomery.outputs[0], minus_one);
    EXPECT_EQ(report.barrett.outputs[0], minus_one);
}

TEST_F(HarnessTest, EmptyFoldReturnsStartValue) {
    WorkloadReport report = verify_fold(kGoldilocks, 123456789, {});

    EXPECT_EQ(report.naive.outputs[0], 123456789);
    EXPECT_EQ(report.montgomery.outputs[0], 123456789);
    EXPECT_EQ(report.barrett.outputs[0], 123456789);
    EXPECT_EQ(report.operations, 0u);
}

TEST_F(HarnessTest, FoldWithZeroIsZero) {
    WorkloadReport report = verify_fold(kBabyBear, 99, {17, 0, 23});
    EXPECT_EQ(report.montgomery.outputs[0], 0);
    EXPECT_TRUE(report.agree());
}

TEST_F(HarnessTest, RandomFoldAgrees) {
    mpz_class x0 = sampler_.below(kGoldilocks);
    std::vector<mpz_class> values = sampler_.sample(kGoldilocks, 500);

    WorkloadReport report = run_fold(kGoldilocks, x0, values);
    EXPECT_TRUE(report.agree());
    EXPECT_NO_THROW(check_agreement(report));
}

TEST_F(HarnessTest, FoldRejectsEvenModulus) {
    EXPECT_THROW(run_fold(4, 1, {3}), modred::InvalidModulus);
    EXPECT_THROW(run_fold(0, 0, {}), modred::InvalidModulus);
}

TEST_F(HarnessTest, FoldRejectsOutOfRangeResidues) {
    EXPECT_THROW(run_fold(kBabyBear, kBabyBear, {3}), std::out_of_range);
    EXPECT_THROW(run_fold(kBabyBear, 5, {3, kBabyBear + 1}), std::out_of_range);
    EXPECT_THROW(run_fold(kBabyBear, 5, {-1}), std::out_of_range);
}

// ============================================================================
// Pairwise and sum of products
// ============================================================================

TEST_F(HarnessTest, PairwiseAgrees) {
    std::vector<mpz_class> xs = sampler_.sample(kBabyBear, 200);
    std::vector<mpz_class> ys = sampler_.sample(kBabyBear, 200);

    WorkloadReport report = run_pairwise(kBabyBear, xs, ys);
    ASSERT_EQ(report.naive.outputs.size(), 200u);
    EXPECT_EQ(report.workload, Workload::Pairwise);
    EXPECT_TRUE(report.agree());

    for (size_t i = 0; i < xs.size(); ++i) {
        EXPECT_EQ(report.naive.outputs[i], mpz_class((xs[i] * ys[i]) % kBabyBear));
    }
}

TEST_F(HarnessTest, SumOfProductsAgrees) {
    std::vector<mpz_class> xs = {2, 3, 4};
    std::vector<mpz_class> ys = {5, 6, 7};

    WorkloadReport report = run_sum_of_products(kBabyBear, xs, ys);
    ASSERT_EQ(report.naive.outputs.size(), 1u);
    EXPECT_EQ(report.naive.outputs[0], 56);   // 10 + 18 + 28
    EXPECT_EQ(report.montgomery.outputs[0], 56);
    EXPECT_EQ(report.barrett.outputs[0], 56);
}

TEST_F(HarnessTest, SumOfProductsWrapsAroundModulus) {
    std::vector<mpz_class> xs = sampler_.sample(kGoldilocks, 300);
    std::vector<mpz_class> ys = sampler_.sample(kGoldilocks, 300);

    mpz_class expected = 0;
    for (size_t i = 0; i < xs.size(); ++i) {
        expected += xs[i] * ys[i];
    }
    expected %= kGoldilocks;

    WorkloadReport report = run_sum_of_products(kGoldilocks, xs, ys);
    EXPECT_EQ(report.naive.outputs[0], expected);
    EXPECT_TRUE(report.agree());
}

TEST_F(HarnessTest, MismatchedOperandLengthsAreRejected) {
    EXPECT_THROW(run_pairwise(kBabyBear, {1, 2}, {3}), std::invalid_argument);
    EXPECT_THROW(run_sum_of_products(kBabyBear, {1}, {}), std::invalid_argument);
}

// ============================================================================
// Agreement check
// ============================================================================

TEST_F(HarnessTest, TamperedReportRaisesMismatch) {
    WorkloadReport report = run_fold(kBabyBear, 5, {3, 7});
    report.barrett.outputs[0] = 104;

    EXPECT_FALSE(report.agree());
    try {
        check_agreement(report);
        FAIL() << "expected ReductionMismatch";
    } catch (const modred::ReductionMismatch& e) {
        EXPECT_EQ(e.engine(), "Barrett");
        EXPECT_EQ(e.code(), MODRED_ERROR_REDUCTION_MISMATCH);
        EXPECT_NE(std::string(e.what()).find("104"), std::string::npos);
    }
}

TEST_F(HarnessTest, MissingOutputsRaiseMismatch) {
    WorkloadReport report = run_pairwise(kBabyBear, {1, 2}, {3, 4});
    report.montgomery.outputs.pop_back();
    EXPECT_THROW(check_agreement(report), modred::ReductionMismatch);
}

TEST_F(HarnessTest, EngineNames) {
    WorkloadReport report = run_fold(kBabyBear, 1, {2});
    EXPECT_EQ(report.naive.engine, "Naive");
    EXPECT_EQ(report.montgomery.engine, "Montgomery");
    EXPECT_EQ(report.barrett.engine, "Barrett");
    EXPECT_GE(report.montgomery.elapsed_ms(), 0.0);
}

TEST(WorkloadNameTest, Names) {
    EXPECT_STREQ(workload_name(Workload::Fold), "fold");
    EXPECT_STREQ(workload_name(Workload::Pairwise), "pairwise");
    EXPECT_STREQ(workload_name(Workload::SumOfProducts), "sum");
}
