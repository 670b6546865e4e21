// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "penetrance_model.hpp"

#include <utility>

namespace heredity {

PenetranceModel::PenetranceModel(TraitTable trait_given_genes)
: trait_given_genes_ {std::move(trait_given_genes)}
{}

Probability PenetranceModel::evaluate(const bool has_trait, const GeneCount genes) const noexcept
{
    return trait_given_genes_[index_of(genes)][has_trait];
}

} // namespace heredity
