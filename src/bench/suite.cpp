/**
 * @file suite.cpp
 * @brief Benchmark suite driver
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "modred/bench/suite.h"
#include "modred/bench/report.h"
#include "modred/utils/random.h"

#include <ostream>
#include <stdexcept>
#include <utility>

namespace modred {
namespace bench {

std::vector<mpz_class> default_moduli() {
    return {
        mpz_class("2013265921"),
        mpz_class("18446744069414584321"),
        mpz_class("170141183460469231731687303715884105727"),
        mpz_class("340282366920938463463374607431768211507"),
        mpz_class("57896044618658097711785492504343953926634992332820282019728792003956564819949"),
    };
}

SuiteConfig default_suite_config() {
    SuiteConfig config;
    config.moduli = default_moduli();
    config.iterations = kDefaultIterations;
    config.seed = utils::clock_seed();
    config.workloads = {Workload::Fold, Workload::Pairwise, Workload::SumOfProducts};
    return config;
}

bool parse_workloads(const std::string& name, std::vector<Workload>& workloads) {
    if (name == "all") {
        workloads = {Workload::Fold, Workload::Pairwise, Workload::SumOfProducts};
    } else if (name == "fold") {
        workloads = {Workload::Fold};
    } else if (name == "pairwise" || name == "pairs") {
        workloads = {Workload::Pairwise};
    } else if (name == "sum") {
        workloads = {Workload::SumOfProducts};
    } else {
        return false;
    }
    return true;
}

bool parse_unsigned(const std::string& text, unsigned long& value) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }

    mpz_class parsed(text, 10);
    if (!parsed.fits_ulong_p()) {
        return false;
    }
    value = parsed.get_ui();
    return true;
}

static WorkloadReport run_workload(Workload workload,
                                   const mpz_class& n,
                                   size_t iterations,
                                   utils::ResidueSampler& sampler) {
    // Sample before timing starts
    switch (workload) {
        case Workload::Fold: {
            mpz_class x0 = sampler.below(n);
            std::vector<mpz_class> values = sampler.sample(n, iterations);
            return run_fold(n, x0, values);
        }
        case Workload::Pairwise: {
            std::vector<mpz_class> xs = sampler.sample(n, iterations);
            std::vector<mpz_class> ys = sampler.sample(n, iterations);
            return run_pairwise(n, xs, ys);
        }
        case Workload::SumOfProducts:
        default: {
            std::vector<mpz_class> xs = sampler.sample(n, iterations);
            std::vector<mpz_class> ys = sampler.sample(n, iterations);
            return run_sum_of_products(n, xs, ys);
        }
    }
}

std::vector<WorkloadReport> run_suite(const SuiteConfig& config, std::ostream& os) {
    if (config.iterations > kMaxIterations) {
        throw std::invalid_argument("iterations " + std::to_string(config.iterations) +
                                    " exceeds the limit of " + std::to_string(kMaxIterations));
    }

    std::vector<WorkloadReport> reports;
    utils::ResidueSampler sampler(config.seed);

    os << "Seed: " << config.seed << ", operations per workload: "
       << config.iterations << "\n";
    os << "Montgomery operands are converted to Montgomery form before timing;\n";
    os << "the start value and the final result conversions are timed.\n";

    for (const auto& n : config.moduli) {
        print_modulus_header(os, n);

        if (config.verbose) {
            math::MontgomeryEngine mont(n);
            math::BarrettEngine barrett(n);
            print_context(os, mont, barrett);
        }

        for (Workload workload : config.workloads) {
            WorkloadReport report = run_workload(workload, n, config.iterations, sampler);
            print_report(os, report);
            check_agreement(report);
            reports.push_back(std::move(report));
        }
    }

    return reports;
}

} // namespace bench
} // namespace modred
