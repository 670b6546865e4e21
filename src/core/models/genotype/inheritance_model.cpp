// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "inheritance_model.hpp"

#include <utility>

namespace heredity {

InheritanceModel::InheritanceModel(TransmissionModel transmission_model)
: transmission_model_ {std::move(transmission_model)}
{}

// p(offspring | mother, father)
Probability InheritanceModel::evaluate(const GeneCount offspring, const GeneCount mother, const GeneCount father) const noexcept
{
    const auto from_mother = transmission_model_.evaluate(mother);
    const auto from_father = transmission_model_.evaluate(father);
    switch (offspring) {
        case GeneCount::zero:
            return (1 - from_mother) * (1 - from_father);
        case GeneCount::one:
            return from_mother * (1 - from_father) + (1 - from_mother) * from_father;
        case GeneCount::two:
            return from_mother * from_father;
    }
    return 0;
}

} // namespace heredity
