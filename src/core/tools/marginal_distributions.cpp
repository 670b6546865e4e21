// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "marginal_distributions.hpp"

#include <utility>
#include <cmath>
#include <stdexcept>

#include "utils/maths.hpp"
#include "exceptions/unknown_person_error.hpp"
#include "exceptions/degenerate_distribution_error.hpp"

namespace heredity {

MarginalDistributions::MarginalDistributions(std::vector<PersonName> people)
: people_ {std::move(people)}
, distributions_ {}
{
    distributions_.reserve(people_.size());
    for (const auto& person : people_) {
        distributions_.emplace(person, Distributions {{}, {}});
    }
}

void MarginalDistributions::update(const GeneAssignment& genes, const TraitAssignment& traits, const Probability weight)
{
    if (state_ == State::finalised) {
        throw FinalisedDistributionsError {"update"};
    }
    if (std::isnan(weight) || weight < 0) {
        throw std::domain_error {"MarginalDistributions::update: weight is not a probability"};
    }
    for (auto& p : distributions_) {
        p.second.genes[index_of(genes.count_of(p.first))] += weight;
        p.second.trait[traits.has_trait(p.first)] += weight;
    }
    state_ = State::accumulating;
}

void MarginalDistributions::update(const PersonSet& one_gene, const PersonSet& two_genes, const PersonSet& have_trait,
                                   const Probability weight)
{
    update(GeneAssignment {one_gene, two_genes}, TraitAssignment {have_trait}, weight);
}

void MarginalDistributions::normalise()
{
    if (state_ == State::finalised) {
        throw FinalisedDistributionsError {"normalise"};
    }
    for (const auto& person : people_) {
        auto& distributions = distributions_.at(person);
        if (maths::sum(distributions.genes) <= 0) {
            throw DegenerateDistributionError {person, "gene"};
        }
        if (maths::sum(distributions.trait) <= 0) {
            throw DegenerateDistributionError {person, "trait"};
        }
        maths::normalise(distributions.genes);
        maths::normalise(distributions.trait);
    }
    state_ = State::finalised;
}

MarginalDistributions::State MarginalDistributions::state() const noexcept
{
    return state_;
}

bool MarginalDistributions::is_finalised() const noexcept
{
    return state_ == State::finalised;
}

const std::vector<PersonName>& MarginalDistributions::people() const noexcept
{
    return people_;
}

std::size_t MarginalDistributions::num_people() const noexcept
{
    return people_.size();
}

const MarginalDistributions::GeneDistribution& MarginalDistributions::gene_distribution(const PersonName& person) const
{
    return distributions_of(person).genes;
}

const MarginalDistributions::TraitDistribution& MarginalDistributions::trait_distribution(const PersonName& person) const
{
    return distributions_of(person).trait;
}

Probability MarginalDistributions::probability_of(const PersonName& person, const GeneCount count) const
{
    return gene_distribution(person)[index_of(count)];
}

Probability MarginalDistributions::probability_of_trait(const PersonName& person, const bool has_trait) const
{
    return trait_distribution(person)[has_trait];
}

// private methods

const MarginalDistributions::Distributions& MarginalDistributions::distributions_of(const PersonName& person) const
{
    const auto itr = distributions_.find(person);
    if (itr == std::cend(distributions_)) {
        throw UnknownPersonError {person, "MarginalDistributions"};
    }
    return itr->second;
}

// non-member methods

MarginalDistributions make_marginal_distributions(const Pedigree& pedigree)
{
    return MarginalDistributions {pedigree.members()};
}

FinalisedDistributionsError::FinalisedDistributionsError(std::string operation)
: operation_ {std::move(operation)}
{}

std::string FinalisedDistributionsError::do_where() const
{
    return "MarginalDistributions::" + operation_;
}

std::string FinalisedDistributionsError::do_why() const
{
    return "the distributions have already been normalised";
}

} // namespace heredity
