// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "gene_assignment.hpp"

#include <utility>

namespace heredity {

GeneAssignment::GeneAssignment(const PersonSet& one_copy, const PersonSet& two_copies)
{
    counts_.reserve(one_copy.size() + two_copies.size());
    for (const auto& person : one_copy) {
        counts_.emplace(person, GeneCount::one);
    }
    for (const auto& person : two_copies) {
        if (one_copy.count(person) == 1) {
            throw OverlappingGeneSets {person};
        }
        counts_.emplace(person, GeneCount::two);
    }
}

void GeneAssignment::assign(const PersonName& person, const GeneCount count)
{
    counts_[person] = count;
}

GeneCount GeneAssignment::count_of(const PersonName& person) const noexcept
{
    const auto itr = counts_.find(person);
    return itr != std::cend(counts_) ? itr->second : GeneCount::zero;
}

std::size_t GeneAssignment::size() const noexcept
{
    return counts_.size();
}

GeneAssignment::const_iterator GeneAssignment::begin() const noexcept
{
    return std::cbegin(counts_);
}

GeneAssignment::const_iterator GeneAssignment::end() const noexcept
{
    return std::cend(counts_);
}

OverlappingGeneSets::OverlappingGeneSets(PersonName person) : person_ {std::move(person)} {}

const PersonName& OverlappingGeneSets::person() const noexcept
{
    return person_;
}

std::string OverlappingGeneSets::do_where() const
{
    return "GeneAssignment";
}

std::string OverlappingGeneSets::do_why() const
{
    return "the person '" + person_ + "' is assigned both one and two gene copies";
}

} // namespace heredity
