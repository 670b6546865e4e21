// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "pedigree_model.hpp"

#include <iterator>
#include <algorithm>

#include "exceptions/unknown_person_error.hpp"

namespace heredity {

PedigreeModel::PedigreeModel(const Pedigree& pedigree, const ProbabilityTables& tables)
: PedigreeModel {pedigree,
                 tables.gene_prior,
                 InheritanceModel {TransmissionModel {tables.mutation_rate}},
                 PenetranceModel {tables.trait_given_genes}}
{}

PedigreeModel::PedigreeModel(const Pedigree& pedigree,
                             GenePrior gene_prior,
                             InheritanceModel inheritance_model,
                             PenetranceModel penetrance_model)
: founders_ {}
, offspring_ {}
, members_ {}
, gene_prior_ {std::move(gene_prior)}
, inheritance_model_ {std::move(inheritance_model)}
, penetrance_model_ {std::move(penetrance_model)}
{
    const auto members = pedigree.members();
    founders_.reserve(members.size());
    offspring_.reserve(members.size());
    members_.reserve(members.size());
    for (const auto& person : members) {
        auto parents = pedigree.parents_of(person);
        if (parents) {
            offspring_.emplace_back(person, std::make_pair(std::move(parents->mother), std::move(parents->father)));
        } else {
            founders_.push_back(person);
        }
        members_.insert(person);
    }
}

Probability PedigreeModel::evaluate(const GeneAssignment& genes, const TraitAssignment& traits) const
{
    check_members(genes, traits);
    Probability result {1};
    for (const auto& person : founders_) {
        const auto count = genes.count_of(person);
        result *= gene_prior_[index_of(count)];
        result *= penetrance_model_.evaluate(traits.has_trait(person), count);
    }
    for (const auto& p : offspring_) {
        const auto count = genes.count_of(p.first);
        result *= inheritance_model_.evaluate(count, genes.count_of(p.second.first), genes.count_of(p.second.second));
        result *= penetrance_model_.evaluate(traits.has_trait(p.first), count);
    }
    return result;
}

// private methods

void PedigreeModel::check_members(const GeneAssignment& genes, const TraitAssignment& traits) const
{
    const auto is_member = [this] (const PersonName& person) { return members_.count(person) == 1; };
    const auto gene_itr = std::find_if(std::cbegin(genes), std::cend(genes),
                                       [&] (const auto& p) { return !is_member(p.first); });
    if (gene_itr != std::cend(genes)) {
        throw UnknownPersonError {gene_itr->first, "PedigreeModel::evaluate"};
    }
    const auto trait_itr = std::find_if(std::cbegin(traits), std::cend(traits),
                                        [&] (const auto& person) { return !is_member(person); });
    if (trait_itr != std::cend(traits)) {
        throw UnknownPersonError {*trait_itr, "PedigreeModel::evaluate"};
    }
}

// non-member methods

Probability joint_probability(const Pedigree& pedigree,
                              const PersonSet& one_gene,
                              const PersonSet& two_genes,
                              const PersonSet& have_trait,
                              const ProbabilityTables& tables)
{
    const PedigreeModel model {pedigree, tables};
    return model.evaluate(GeneAssignment {one_gene, two_genes}, TraitAssignment {have_trait});
}

} // namespace heredity
