// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef inheritance_model_hpp
#define inheritance_model_hpp

#include "config/common.hpp"
#include "core/types/gene_count.hpp"
#include "core/models/mutation/transmission_model.hpp"

namespace heredity {

class InheritanceModel
{
public:
    InheritanceModel() = delete;
    
    InheritanceModel(TransmissionModel transmission_model);
    
    InheritanceModel(const InheritanceModel&)            = default;
    InheritanceModel& operator=(const InheritanceModel&) = default;
    InheritanceModel(InheritanceModel&&)                 = default;
    InheritanceModel& operator=(InheritanceModel&&)      = default;
    
    ~InheritanceModel() = default;
    
    // p(offspring | mother, father)
    Probability evaluate(GeneCount offspring, GeneCount mother, GeneCount father) const noexcept;
    
private:
    TransmissionModel transmission_model_;
};

} // namespace heredity

#endif
