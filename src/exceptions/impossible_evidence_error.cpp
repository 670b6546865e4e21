// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "impossible_evidence_error.hpp"

namespace heredity {

std::string ImpossibleEvidenceError::do_where() const
{
    return "compute_marginal_distributions";
}

std::string ImpossibleEvidenceError::do_why() const
{
    return "every configuration consistent with the observed traits has zero probability";
}

std::string ImpossibleEvidenceError::do_help() const
{
    return "the observed traits cannot occur with the given probabilities; check the --trait-given-*, "
           "--gene-prior and --mutation-rate options, or the traits recorded in the pedigree";
}

} // namespace heredity
