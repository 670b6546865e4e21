// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "trait_assignment.hpp"

#include <utility>

namespace heredity {

TraitAssignment::TraitAssignment(PersonSet have_trait) : have_trait_ {std::move(have_trait)} {}

void TraitAssignment::assign(const PersonName& person, const bool has_trait)
{
    if (has_trait) {
        have_trait_.insert(person);
    } else {
        have_trait_.erase(person);
    }
}

bool TraitAssignment::has_trait(const PersonName& person) const noexcept
{
    return have_trait_.count(person) == 1;
}

std::size_t TraitAssignment::size() const noexcept
{
    return have_trait_.size();
}

TraitAssignment::const_iterator TraitAssignment::begin() const noexcept
{
    return std::cbegin(have_trait_);
}

TraitAssignment::const_iterator TraitAssignment::end() const noexcept
{
    return std::cend(have_trait_);
}

} // namespace heredity
