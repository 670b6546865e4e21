// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef probability_tables_hpp
#define probability_tables_hpp

#include <array>
#include <string>
#include <iosfwd>

#include "config/common.hpp"
#include "core/types/gene_count.hpp"
#include "exceptions/user_error.hpp"

namespace heredity {

/**
 The fixed probabilities of the heredity network. These are configuration, not parameters to be
 learned, and are immutable once a model is built from them.
 */
struct ProbabilityTables
{
    using GenePrior  = std::array<Probability, num_gene_counts>;
    using TraitTable = std::array<std::array<Probability, 2>, num_gene_counts>;
    
    // p(gene count) for a person with no parents
    GenePrior gene_prior;
    // p(a transmitted copy flips state)
    Probability mutation_rate;
    // p(trait | gene count), indexed [gene count][trait]
    TraitTable trait_given_genes;
};

ProbabilityTables make_default_probability_tables();

// trait_probabilities[g] is p(trait = true | g)
ProbabilityTables make_probability_tables(ProbabilityTables::GenePrior gene_prior,
                                          Probability mutation_rate,
                                          std::array<Probability, num_gene_counts> trait_probabilities);

Probability prior_probability(const ProbabilityTables& tables, GeneCount count) noexcept;
Probability trait_probability(const ProbabilityTables& tables, GeneCount count, bool has_trait) noexcept;

class InvalidProbabilityTables : public UserError
{
public:
    InvalidProbabilityTables(std::string reason);
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    std::string reason_;
};

// Throws InvalidProbabilityTables if any entry is not a probability or a distribution does not sum to one
void validate(const ProbabilityTables& tables);

std::ostream& operator<<(std::ostream& os, const ProbabilityTables& tables);

} // namespace heredity

#endif
