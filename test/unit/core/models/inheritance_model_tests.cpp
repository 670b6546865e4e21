// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>

#include "core/types/gene_count.hpp"
#include "core/models/mutation/transmission_model.hpp"
#include "core/models/genotype/inheritance_model.hpp"
#include "core/models/genotype/penetrance_model.hpp"
#include "core/models/probability_tables.hpp"

namespace heredity { namespace test {

namespace { constexpr double tolerance {1e-10}; }

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(models)
BOOST_AUTO_TEST_SUITE(inheritance_model)

BOOST_AUTO_TEST_CASE(transmission_depends_on_parent_copies_and_mutation)
{
    const TransmissionModel model {0.01};
    BOOST_CHECK_CLOSE(model.evaluate(GeneCount::zero), 0.01, tolerance);
    BOOST_CHECK_CLOSE(model.evaluate(GeneCount::one), 0.5, tolerance);
    BOOST_CHECK_CLOSE(model.evaluate(GeneCount::two), 0.99, tolerance);
}

BOOST_AUTO_TEST_CASE(offspring_of_parents_without_the_gene_only_get_copies_by_mutation)
{
    const double m {0.01};
    const InheritanceModel model {TransmissionModel {m}};
    const auto zero = GeneCount::zero;
    BOOST_CHECK_CLOSE(model.evaluate(GeneCount::zero, zero, zero), (1 - m) * (1 - m), tolerance);
    BOOST_CHECK_CLOSE(model.evaluate(GeneCount::one, zero, zero), 2 * m * (1 - m), tolerance);
    BOOST_CHECK_CLOSE(model.evaluate(GeneCount::two, zero, zero), m * m, tolerance);
}

BOOST_AUTO_TEST_CASE(inheritance_probabilities_sum_to_one)
{
    const InheritanceModel model {TransmissionModel {0.05}};
    for (const auto mother : all_gene_counts) {
        for (const auto father : all_gene_counts) {
            double total {0};
            for (const auto offspring : all_gene_counts) {
                const auto p = model.evaluate(offspring, mother, father);
                BOOST_CHECK(p >= 0 && p <= 1);
                total += p;
            }
            BOOST_CHECK_CLOSE(total, 1.0, tolerance);
        }
    }
}

BOOST_AUTO_TEST_CASE(one_copy_can_come_from_either_parent)
{
    const InheritanceModel model {TransmissionModel {0.01}};
    // mother passes with 0.01, father with 0.99
    BOOST_CHECK_CLOSE(model.evaluate(GeneCount::one, GeneCount::zero, GeneCount::two), 0.01 * 0.01 + 0.99 * 0.99, tolerance);
    BOOST_CHECK_CLOSE(model.evaluate(GeneCount::one, GeneCount::one, GeneCount::one), 0.5, tolerance);
    BOOST_CHECK_CLOSE(model.evaluate(GeneCount::two, GeneCount::one, GeneCount::one), 0.25, tolerance);
}

BOOST_AUTO_TEST_CASE(penetrance_is_read_from_the_trait_table)
{
    const PenetranceModel model {make_default_probability_tables().trait_given_genes};
    BOOST_CHECK_CLOSE(model.evaluate(true, GeneCount::two), 0.65, tolerance);
    BOOST_CHECK_CLOSE(model.evaluate(false, GeneCount::two), 0.35, 1e-8);
    BOOST_CHECK_CLOSE(model.evaluate(true, GeneCount::zero), 0.01, tolerance);
    BOOST_CHECK_CLOSE(model.evaluate(false, GeneCount::one), 0.44, 1e-8);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
