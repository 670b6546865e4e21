// Copyright (c) 2015-2020 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef heredity_hpp
#define heredity_hpp

#include <string>

#include "basics/pedigree.hpp"
#include "core/models/probability_tables.hpp"
#include "core/tools/marginal_distributions.hpp"
#include "inference_components.hpp"

namespace heredity {

struct UserCommandInfo
{
    std::string command, options;
};

// Exact marginal distributions of every person's gene count and trait, by summing the joint
// probability of every configuration consistent with the observed traits.
MarginalDistributions compute_marginal_distributions(const Pedigree& pedigree, const ProbabilityTables& tables);

void run_heredity(InferenceComponents& components, UserCommandInfo info);

} // namespace heredity

#endif
