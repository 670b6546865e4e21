// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <vector>
#include <string>
#include <stdexcept>

#include "basics/pedigree.hpp"
#include "exceptions/unknown_person_error.hpp"

namespace heredity { namespace test {

namespace {

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

BOOST_AUTO_TEST_SUITE(basics)
BOOST_AUTO_TEST_SUITE(pedigree)

BOOST_AUTO_TEST_CASE(members_are_kept_in_the_order_they_are_added)
{
    const auto pedigree = make_potter_family();
    const std::vector<PersonName> expected {"Harry", "James", "Lily"};
    const auto members = pedigree.members();
    BOOST_CHECK_EQUAL_COLLECTIONS(std::cbegin(members), std::cend(members), std::cbegin(expected), std::cend(expected));
    BOOST_CHECK_EQUAL(pedigree.size(), 3);
    BOOST_CHECK(!pedigree.is_empty());
}

BOOST_AUTO_TEST_CASE(founders_have_no_parents)
{
    const auto pedigree = make_potter_family();
    BOOST_CHECK(!pedigree.has_parents("James"));
    BOOST_CHECK(!pedigree.has_parents("Lily"));
    BOOST_CHECK(pedigree.is_founder("Lily"));
    BOOST_CHECK(!pedigree.parents_of("James"));
    BOOST_CHECK(!pedigree.mother_of("James"));
    BOOST_CHECK(!pedigree.father_of("Lily"));
    const auto founders = get_founders(pedigree);
    const std::vector<PersonName> expected {"James", "Lily"};
    BOOST_CHECK_EQUAL_COLLECTIONS(std::cbegin(founders), std::cend(founders), std::cbegin(expected), std::cend(expected));
}

BOOST_AUTO_TEST_CASE(parents_can_be_queried)
{
    const auto pedigree = make_potter_family();
    BOOST_REQUIRE(pedigree.has_parents("Harry"));
    const auto parents = pedigree.parents_of("Harry");
    BOOST_REQUIRE(parents);
    BOOST_CHECK_EQUAL(parents->mother, "Lily");
    BOOST_CHECK_EQUAL(parents->father, "James");
    BOOST_CHECK_EQUAL(*pedigree.mother_of("Harry"), "Lily");
    BOOST_CHECK_EQUAL(*pedigree.father_of("Harry"), "James");
    BOOST_CHECK(!pedigree.parents_of("James"));
}

BOOST_AUTO_TEST_CASE(observed_traits_are_optional)
{
    const auto pedigree = make_potter_family();
    BOOST_CHECK(!pedigree.observed_trait("Harry"));
    BOOST_REQUIRE(pedigree.observed_trait("James"));
    BOOST_CHECK(*pedigree.observed_trait("James"));
    BOOST_REQUIRE(pedigree.observed_trait("Lily"));
    BOOST_CHECK(!*pedigree.observed_trait("Lily"));
    BOOST_CHECK_EQUAL(count_unobserved(pedigree), 1);
}

BOOST_AUTO_TEST_CASE(querying_non_members_throws)
{
    const auto pedigree = make_potter_family();
    BOOST_CHECK(!pedigree.is_member("Ron"));
    BOOST_CHECK_THROW(pedigree.has_parents("Ron"), UnknownPersonError);
    BOOST_CHECK_THROW(pedigree.parents_of("Ron"), UnknownPersonError);
    BOOST_CHECK_THROW(pedigree.observed_trait("Ron"), UnknownPersonError);
}

BOOST_AUTO_TEST_CASE(members_must_be_unique)
{
    auto pedigree = make_potter_family();
    BOOST_CHECK_THROW(pedigree.add_member({"Harry"}), std::invalid_argument);
    BOOST_CHECK_EQUAL(pedigree.size(), 3);
}

BOOST_AUTO_TEST_CASE(parents_must_be_members_and_distinct)
{
    auto pedigree = make_potter_family();
    pedigree.add_member({"Ron"});
    BOOST_CHECK_THROW(pedigree.set_parents("Ron", "Molly", "Arthur"), UnknownPersonError);
    BOOST_CHECK_THROW(pedigree.set_parents("Ron", "Lily", "Lily"), std::invalid_argument);
    BOOST_CHECK_THROW(pedigree.set_parents("Harry", "Lily", "James"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(is_acyclic_detects_people_who_are_their_own_ancestor)
{
    auto pedigree = make_potter_family();
    BOOST_CHECK(pedigree.is_acyclic());
    Pedigree cyclic {};
    cyclic.add_member({"A"});
    cyclic.add_member({"B"});
    cyclic.add_member({"C"});
    cyclic.set_parents("A", "B", "C");
    BOOST_CHECK(cyclic.is_acyclic());
    cyclic.set_parents("B", "A", "C");
    BOOST_CHECK(!cyclic.is_acyclic());
}

BOOST_AUTO_TEST_CASE(clear_removes_all_members)
{
    auto pedigree = make_potter_family();
    pedigree.clear();
    BOOST_CHECK(pedigree.is_empty());
    BOOST_CHECK(pedigree.members().empty());
    BOOST_CHECK(!pedigree.is_member("Harry"));
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
