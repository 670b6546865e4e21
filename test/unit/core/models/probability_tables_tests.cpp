// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>

#include <sstream>

#include "core/models/probability_tables.hpp"

namespace heredity { namespace test {

namespace { constexpr double tolerance {1e-10}; }

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(models)
BOOST_AUTO_TEST_SUITE(probability_tables)

BOOST_AUTO_TEST_CASE(default_tables_are_valid)
{
    const auto tables = make_default_probability_tables();
    BOOST_CHECK_NO_THROW(validate(tables));
    BOOST_CHECK_CLOSE(prior_probability(tables, GeneCount::zero), 0.96, tolerance);
    BOOST_CHECK_CLOSE(prior_probability(tables, GeneCount::one), 0.03, tolerance);
    BOOST_CHECK_CLOSE(prior_probability(tables, GeneCount::two), 0.01, tolerance);
    BOOST_CHECK_CLOSE(tables.mutation_rate, 0.01, tolerance);
    BOOST_CHECK_CLOSE(trait_probability(tables, GeneCount::two, true), 0.65, tolerance);
    BOOST_CHECK_CLOSE(trait_probability(tables, GeneCount::one, true), 0.56, tolerance);
    BOOST_CHECK_CLOSE(trait_probability(tables, GeneCount::zero, true), 0.01, tolerance);
}

BOOST_AUTO_TEST_CASE(trait_distributions_are_complementary)
{
    const auto tables = make_probability_tables({0.5, 0.3, 0.2}, 0.1, {0.2, 0.5, 0.9});
    for (const auto count : all_gene_counts) {
        BOOST_CHECK_CLOSE(trait_probability(tables, count, true) + trait_probability(tables, count, false), 1.0, tolerance);
    }
    BOOST_CHECK_CLOSE(trait_probability(tables, GeneCount::two, false), 0.1, 1e-8);
}

BOOST_AUTO_TEST_CASE(validate_rejects_gene_priors_that_are_not_distributions)
{
    BOOST_CHECK_THROW(validate(make_probability_tables({0.5, 0.3, 0.1}, 0.01, {0.01, 0.56, 0.65})), InvalidProbabilityTables);
    BOOST_CHECK_THROW(validate(make_probability_tables({1.5, -0.3, -0.2}, 0.01, {0.01, 0.56, 0.65})), InvalidProbabilityTables);
}

BOOST_AUTO_TEST_CASE(validate_rejects_values_outside_the_unit_interval)
{
    BOOST_CHECK_THROW(validate(make_probability_tables({0.96, 0.03, 0.01}, 1.5, {0.01, 0.56, 0.65})), InvalidProbabilityTables);
    BOOST_CHECK_THROW(validate(make_probability_tables({0.96, 0.03, 0.01}, 0.01, {0.01, 1.56, 0.65})), InvalidProbabilityTables);
    auto tables = make_default_probability_tables();
    tables.trait_given_genes[index_of(GeneCount::one)] = {0.5, 0.6};
    BOOST_CHECK_THROW(validate(tables), InvalidProbabilityTables);
}

BOOST_AUTO_TEST_CASE(tables_can_be_printed)
{
    std::ostringstream ss {};
    ss << make_default_probability_tables();
    BOOST_CHECK_EQUAL(ss.str(), "gene prior {0: 0.96, 1: 0.03, 2: 0.01}; mutation rate 0.01; p(trait | genes) {0: 0.01, 1: 0.56, 2: 0.65}");
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
