// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef transmission_model_hpp
#define transmission_model_hpp

#include <array>

#include "config/common.hpp"
#include "core/types/gene_count.hpp"

namespace heredity {

/**
 TransmissionModel gives the probability that a parent passes a copy of the gene to a child. The
 parent passes one of its two copies at random, and the passed copy flips state with the mutation
 rate.
 */
class TransmissionModel
{
public:
    TransmissionModel() = delete;
    
    TransmissionModel(Probability mutation_rate);
    
    TransmissionModel(const TransmissionModel&)            = default;
    TransmissionModel& operator=(const TransmissionModel&) = default;
    TransmissionModel(TransmissionModel&&)                 = default;
    TransmissionModel& operator=(TransmissionModel&&)      = default;
    
    ~TransmissionModel() = default;
    
    // p(copy passed | parent)
    Probability evaluate(GeneCount parent) const noexcept;
    
private:
    std::array<Probability, num_gene_counts> transmission_probabilities_;
};

} // namespace heredity

#endif
