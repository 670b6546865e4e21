// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef trait_assignment_hpp
#define trait_assignment_hpp

#include <cstddef>

#include "config/common.hpp"

namespace heredity {

/**
 A TraitAssignment is the set of people hypothesised to express the trait; everyone else does not.
 */
class TraitAssignment
{
public:
    using const_iterator = PersonSet::const_iterator;
    
    TraitAssignment() = default;
    
    TraitAssignment(PersonSet have_trait);
    
    TraitAssignment(const TraitAssignment&)            = default;
    TraitAssignment& operator=(const TraitAssignment&) = default;
    TraitAssignment(TraitAssignment&&)                 = default;
    TraitAssignment& operator=(TraitAssignment&&)      = default;
    
    ~TraitAssignment() = default;
    
    void assign(const PersonName& person, bool has_trait);
    
    bool has_trait(const PersonName& person) const noexcept;
    
    std::size_t size() const noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;
    
private:
    PersonSet have_trait_;
};

} // namespace heredity

#endif
