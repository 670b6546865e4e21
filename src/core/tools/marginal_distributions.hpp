// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef marginal_distributions_hpp
#define marginal_distributions_hpp

#include <array>
#include <vector>
#include <unordered_map>
#include <string>
#include <cstddef>

#include "config/common.hpp"
#include "basics/pedigree.hpp"
#include "core/types/gene_count.hpp"
#include "core/types/gene_assignment.hpp"
#include "core/types/trait_assignment.hpp"
#include "exceptions/program_error.hpp"

namespace heredity {

/**
 MarginalDistributions accumulates, for each person, the joint probability mass of every
 configuration supplied to update into a gene count distribution and a trait distribution.
 After all configurations have been supplied normalise turns the accumulated mass into
 marginal posterior distributions.
 
 empty -> accumulating (update) -> finalised (normalise). No updates after finalisation.
 */
class MarginalDistributions
{
public:
    using GeneDistribution  = std::array<Probability, num_gene_counts>;
    using TraitDistribution = std::array<Probability, 2>; // indexed by trait
    
    enum class State { empty, accumulating, finalised };
    
    MarginalDistributions() = default;
    
    MarginalDistributions(std::vector<PersonName> people);
    
    MarginalDistributions(const MarginalDistributions&)            = default;
    MarginalDistributions& operator=(const MarginalDistributions&) = default;
    MarginalDistributions(MarginalDistributions&&)                 = default;
    MarginalDistributions& operator=(MarginalDistributions&&)      = default;
    
    ~MarginalDistributions() = default;
    
    void update(const GeneAssignment& genes, const TraitAssignment& traits, Probability weight);
    void update(const PersonSet& one_gene, const PersonSet& two_genes, const PersonSet& have_trait,
                Probability weight);
    
    // Throws DegenerateDistributionError if a person has no accumulated mass
    void normalise();
    
    State state() const noexcept;
    bool is_finalised() const noexcept;
    
    const std::vector<PersonName>& people() const noexcept;
    std::size_t num_people() const noexcept;
    
    const GeneDistribution& gene_distribution(const PersonName& person) const;
    const TraitDistribution& trait_distribution(const PersonName& person) const;
    
    Probability probability_of(const PersonName& person, GeneCount count) const;
    Probability probability_of_trait(const PersonName& person, bool has_trait = true) const;
    
private:
    struct Distributions
    {
        GeneDistribution genes;
        TraitDistribution trait;
    };
    
    std::vector<PersonName> people_;
    std::unordered_map<PersonName, Distributions> distributions_;
    State state_ = State::empty;
    
    const Distributions& distributions_of(const PersonName& person) const;
};

MarginalDistributions make_marginal_distributions(const Pedigree& pedigree);

class FinalisedDistributionsError : public ProgramError
{
public:
    FinalisedDistributionsError(std::string operation);
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    
    std::string operation_;
};

} // namespace heredity

#endif
