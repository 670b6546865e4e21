// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>

#include <initializer_list>

#include "basics/pedigree.hpp"
#include "core/models/probability_tables.hpp"
#include "core/models/genotype/pedigree_model.hpp"
#include "core/tools/hypothesis_enumerator.hpp"
#include "exceptions/unknown_person_error.hpp"

namespace heredity { namespace test {

namespace {

constexpr double tolerance {1e-8};

Pedigree make_potter_family()
{
    Pedigree result {3};
    result.add_member({"Harry"});
    result.add_member({"James", true});
    result.add_member({"Lily", false});
    result.set_parents("Harry", "Lily", "James");
    return result;
}

Pedigree make_three_generation_family()
{
    Pedigree result {};
    for (const auto& person : {"Arthur", "Molly", "Ron", "Hermione", "Rose"}) {
        result.add_member({person});
    }
    result.set_parents("Ron", "Molly", "Arthur");
    result.set_parents("Rose", "Hermione", "Ron");
    return result;
}

} // namespace

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(models)
BOOST_AUTO_TEST_SUITE(pedigree_model)

BOOST_AUTO_TEST_CASE(founder_probability_is_prior_times_penetrance)
{
    Pedigree pedigree {};
    pedigree.add_member({"Alice"});
    const auto tables = make_default_probability_tables();
    BOOST_CHECK_CLOSE(joint_probability(pedigree, {"Alice"}, {}, {"Alice"}),
                      prior_probability(tables, GeneCount::one) * trait_probability(tables, GeneCount::one, true),
                      tolerance);
    BOOST_CHECK_CLOSE(joint_probability(pedigree, {}, {}, {}), 0.96 * 0.99, tolerance);
    BOOST_CHECK_CLOSE(joint_probability(pedigree, {}, {"Alice"}, {}), 0.01 * 0.35, tolerance);
}

BOOST_AUTO_TEST_CASE(joint_probability_multiplies_factors_for_every_person)
{
    const auto pedigree = make_potter_family();
    // Lily 0 copies no trait, James 2 copies with trait, Harry 1 copy no trait
    BOOST_CHECK_CLOSE(joint_probability(pedigree, {"Harry"}, {"James"}, {"James"}), 0.0026643247488, tolerance);
}

BOOST_AUTO_TEST_CASE(joint_probability_uses_the_given_tables)
{
    const auto pedigree = make_potter_family();
    const auto tables = make_probability_tables({0.5, 0.25, 0.25}, 0.0, {0.0, 0.5, 1.0});
    // with no mutation the child of two homozygous parents has exactly one copy
    BOOST_CHECK_CLOSE(joint_probability(pedigree, {"Harry"}, {"James"}, {"James"}, tables), 0.5 * 0.25 * 0.5, tolerance);
    BOOST_CHECK_EQUAL(joint_probability(pedigree, {}, {"James", "Harry"}, {"James"}, tables), 0.0);
}

BOOST_AUTO_TEST_CASE(joint_probabilities_sum_to_one_over_all_configurations)
{
    for (const auto& pedigree : {make_potter_family(), make_three_generation_family()}) {
        Pedigree unobserved {};
        for (const auto& person : pedigree.members()) {
            unobserved.add_member({person});
        }
        for (const auto& person : pedigree.members()) {
            const auto parents = pedigree.parents_of(person);
            if (parents) unobserved.set_parents(person, parents->mother, parents->father);
        }
        const PedigreeModel model {unobserved, make_default_probability_tables()};
        double total {0};
        HypothesisEnumerator {unobserved}.enumerate([&] (const GeneAssignment& genes, const TraitAssignment& traits) {
            const auto p = model.evaluate(genes, traits);
            BOOST_CHECK(p >= 0 && p <= 1);
            total += p;
        });
        BOOST_CHECK_CLOSE(total, 1.0, tolerance);
    }
}

BOOST_AUTO_TEST_CASE(evaluate_throws_if_people_are_not_members)
{
    const auto pedigree = make_potter_family();
    BOOST_CHECK_THROW(joint_probability(pedigree, {"Ron"}, {}, {}), UnknownPersonError);
    BOOST_CHECK_THROW(joint_probability(pedigree, {}, {"Ron"}, {}), UnknownPersonError);
    BOOST_CHECK_THROW(joint_probability(pedigree, {}, {}, {"Ron"}), UnknownPersonError);
}

BOOST_AUTO_TEST_CASE(evaluate_throws_if_gene_sets_overlap)
{
    const auto pedigree = make_potter_family();
    BOOST_CHECK_THROW(joint_probability(pedigree, {"Harry"}, {"Harry"}, {}), OverlappingGeneSets);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
