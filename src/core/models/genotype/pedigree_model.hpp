// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef pedigree_model_hpp
#define pedigree_model_hpp

#include <vector>
#include <utility>

#include "config/common.hpp"
#include "basics/pedigree.hpp"
#include "core/types/gene_assignment.hpp"
#include "core/types/trait_assignment.hpp"
#include "core/models/probability_tables.hpp"
#include "inheritance_model.hpp"
#include "penetrance_model.hpp"

namespace heredity {

/**
 PedigreeModel evaluates the joint probability of one complete configuration of gene counts and
 traits for every member of a pedigree.
 
 The joint probability factorises over people: founders contribute the gene prior, offspring the
 inheritance probability given their parents, and everybody the trait probability given their
 own gene count. The pedigree must be acyclic.
 */
class PedigreeModel
{
public:
    using GenePrior = ProbabilityTables::GenePrior;
    
    PedigreeModel() = delete;
    
    PedigreeModel(const Pedigree& pedigree, const ProbabilityTables& tables);
    
    PedigreeModel(const Pedigree& pedigree,
                  GenePrior gene_prior,
                  InheritanceModel inheritance_model,
                  PenetranceModel penetrance_model);
    
    PedigreeModel(const PedigreeModel&)            = default;
    PedigreeModel& operator=(const PedigreeModel&) = default;
    PedigreeModel(PedigreeModel&&)                 = default;
    PedigreeModel& operator=(PedigreeModel&&)      = default;
    
    ~PedigreeModel() = default;
    
    // p(genes, traits). Throws UnknownPersonError if either assignment names a non-member.
    Probability evaluate(const GeneAssignment& genes, const TraitAssignment& traits) const;
    
private:
    using Parents = std::pair<PersonName, PersonName>;
    
    std::vector<PersonName> founders_;
    std::vector<std::pair<PersonName, Parents>> offspring_;
    PersonSet members_;
    GenePrior gene_prior_;
    InheritanceModel inheritance_model_;
    PenetranceModel penetrance_model_;
    
    void check_members(const GeneAssignment& genes, const TraitAssignment& traits) const;
};

// p(everyone in one_gene has one copy, everyone in two_genes two copies, everyone else none,
//   everyone in have_trait has the trait, everyone else does not)
Probability joint_probability(const Pedigree& pedigree,
                              const PersonSet& one_gene,
                              const PersonSet& two_genes,
                              const PersonSet& have_trait,
                              const ProbabilityTables& tables = make_default_probability_tables());

} // namespace heredity

#endif
