// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef penetrance_model_hpp
#define penetrance_model_hpp

#include "config/common.hpp"
#include "core/types/gene_count.hpp"
#include "core/models/probability_tables.hpp"

namespace heredity {

/**
 PenetranceModel gives the probability that a trait is (or is not) expressed given the number of
 gene copies carried.
 */
class PenetranceModel
{
public:
    using TraitTable = ProbabilityTables::TraitTable;
    
    PenetranceModel() = delete;
    
    PenetranceModel(TraitTable trait_given_genes);
    
    PenetranceModel(const PenetranceModel&)            = default;
    PenetranceModel& operator=(const PenetranceModel&) = default;
    PenetranceModel(PenetranceModel&&)                 = default;
    PenetranceModel& operator=(PenetranceModel&&)      = default;
    
    ~PenetranceModel() = default;
    
    // p(trait | genes)
    Probability evaluate(bool has_trait, GeneCount genes) const noexcept;
    
private:
    TraitTable trait_given_genes_;
};

} // namespace heredity

#endif
