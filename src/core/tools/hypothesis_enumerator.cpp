// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "hypothesis_enumerator.hpp"

#include <algorithm>
#include <iterator>
#include <array>
#include <initializer_list>
#include <limits>

#include "core/types/gene_count.hpp"

namespace heredity {

HypothesisEnumerator::HypothesisEnumerator(const Pedigree& pedigree)
: people_ {}
{
    const auto members = pedigree.members();
    people_.reserve(members.size());
    std::transform(std::cbegin(members), std::cend(members), std::back_inserter(people_),
                   [&pedigree] (const auto& member) -> Person {
                       return {member, pedigree.observed_trait(member)};
                   });
}

std::size_t HypothesisEnumerator::num_people() const noexcept
{
    return people_.size();
}

std::size_t HypothesisEnumerator::num_hypotheses() const noexcept
{
    constexpr auto max_hypotheses = std::numeric_limits<std::size_t>::max();
    std::size_t result {1};
    for (const auto& person : people_) {
        const std::size_t num_states {person.trait ? num_gene_counts : 2 * num_gene_counts};
        if (result > max_hypotheses / num_states) return max_hypotheses;
        result *= num_states;
    }
    return result;
}

std::size_t HypothesisEnumerator::enumerate(const Visitor& visitor) const
{
    GeneAssignment genes {};
    TraitAssignment traits {};
    std::size_t result {0};
    enumerate(0, genes, traits, visitor, result);
    return result;
}

// private methods

void HypothesisEnumerator::enumerate(const std::size_t idx, GeneAssignment& genes, TraitAssignment& traits,
                                     const Visitor& visitor, std::size_t& num_visited) const
{
    if (idx == people_.size()) {
        visitor(genes, traits);
        ++num_visited;
        return;
    }
    const auto& person = people_[idx];
    for (const auto count : all_gene_counts) {
        genes.assign(person.name, count);
        if (person.trait) {
            traits.assign(person.name, *person.trait);
            enumerate(idx + 1, genes, traits, visitor, num_visited);
        } else {
            for (const bool has_trait : {false, true}) {
                traits.assign(person.name, has_trait);
                enumerate(idx + 1, genes, traits, visitor, num_visited);
            }
        }
    }
}

} // namespace heredity
