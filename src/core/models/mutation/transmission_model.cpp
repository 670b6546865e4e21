// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "transmission_model.hpp"

namespace heredity {

TransmissionModel::TransmissionModel(const Probability mutation_rate)
: transmission_probabilities_ {{mutation_rate, 0.5, 1.0 - mutation_rate}}
{}

Probability TransmissionModel::evaluate(const GeneCount parent) const noexcept
{
    // With one copy: 0.5 * (1 - m) + 0.5 * m
    return transmission_probabilities_[index_of(parent)];
}

} // namespace heredity
