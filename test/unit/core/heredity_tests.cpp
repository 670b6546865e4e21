// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <vector>
#include <string>

#include "basics/pedigree.hpp"
#include "core/models/probability_tables.hpp"
#include "core/heredity.hpp"
#include "exceptions/user_error.hpp"
#include "exceptions/impossible_evidence_error.hpp"

namespace heredity { namespace test {

namespace {

// reported distributions are rounded to four decimal places
constexpr double tolerance {5e-5};

Pedigree make_potter_family()
{
    Pedigree result {3};
    result.add_member({"Harry"});
    result.add_member({"James", true});
    result.add_member({"Lily", false});
    result.set_parents("Harry", "Lily", "James");
    return result;
}

} // namespace

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(inference)

BOOST_AUTO_TEST_CASE(marginal_distributions_of_a_trio_are_exact)
{
    const auto distributions = compute_marginal_distributions(make_potter_family(), make_default_probability_tables());
    BOOST_REQUIRE(distributions.is_finalised());
    
    BOOST_CHECK_SMALL(distributions.probability_of("Harry", GeneCount::two) - 0.0092, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of("Harry", GeneCount::one) - 0.4557, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of("Harry", GeneCount::zero) - 0.5351, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of_trait("Harry", true) - 0.2665, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of_trait("Harry", false) - 0.7335, tolerance);
    
    BOOST_CHECK_SMALL(distributions.probability_of("James", GeneCount::two) - 0.1976, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of("James", GeneCount::one) - 0.5106, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of("James", GeneCount::zero) - 0.2918, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of_trait("James", true) - 1.0, tolerance);
    
    BOOST_CHECK_SMALL(distributions.probability_of("Lily", GeneCount::two) - 0.0036, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of("Lily", GeneCount::one) - 0.0136, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of("Lily", GeneCount::zero) - 0.9827, tolerance);
    BOOST_CHECK_SMALL(distributions.probability_of_trait("Lily", false) - 1.0, tolerance);
}

BOOST_AUTO_TEST_CASE(people_are_reported_in_pedigree_order)
{
    const auto distributions = compute_marginal_distributions(make_potter_family(), make_default_probability_tables());
    const std::vector<PersonName> expected {"Harry", "James", "Lily"};
    BOOST_CHECK_EQUAL_COLLECTIONS(std::cbegin(distributions.people()), std::cend(distributions.people()),
                                  std::cbegin(expected), std::cend(expected));
}

BOOST_AUTO_TEST_CASE(observed_people_without_parents_or_offspring_are_independent)
{
    Pedigree pedigree {};
    pedigree.add_member({"Alice", true});
    pedigree.add_member({"Bob"});
    const auto tables = make_default_probability_tables();
    const auto distributions = compute_marginal_distributions(pedigree, tables);
    // p(g | trait) is proportional to p(g) p(trait | g)
    double norm {0};
    for (const auto count : all_gene_counts) {
        norm += prior_probability(tables, count) * trait_probability(tables, count, true);
    }
    for (const auto count : all_gene_counts) {
        const auto expected = prior_probability(tables, count) * trait_probability(tables, count, true) / norm;
        BOOST_CHECK_SMALL(distributions.probability_of("Alice", count) - expected, 1e-12);
        BOOST_CHECK_SMALL(distributions.probability_of("Bob", count) - prior_probability(tables, count), 1e-12);
    }
}

BOOST_AUTO_TEST_CASE(traits_that_cannot_occur_are_user_errors)
{
    Pedigree pedigree {};
    pedigree.add_member({"Harry", true});
    const auto tables = make_probability_tables({0.96, 0.03, 0.01}, 0.01, {0.0, 0.0, 0.0});
    BOOST_CHECK_NO_THROW(validate(tables));
    BOOST_CHECK_THROW(compute_marginal_distributions(pedigree, tables), ImpossibleEvidenceError);
    try {
        compute_marginal_distributions(pedigree, tables);
        BOOST_FAIL("expected ImpossibleEvidenceError");
    } catch (const UserError& e) {
        BOOST_CHECK_EQUAL(e.type(), "user");
        BOOST_CHECK(e.help().find("--trait-given") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(traits_that_cannot_occur_in_a_family_are_user_errors)
{
    Pedigree pedigree {3};
    pedigree.add_member({"Harry", true});
    pedigree.add_member({"James", false});
    pedigree.add_member({"Lily", false});
    pedigree.set_parents("Harry", "Lily", "James");
    // nobody can carry the gene, and only carriers can have the trait
    const auto tables = make_probability_tables({1.0, 0.0, 0.0}, 0.0, {0.0, 0.5, 0.5});
    BOOST_CHECK_THROW(compute_marginal_distributions(pedigree, tables), ImpossibleEvidenceError);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
