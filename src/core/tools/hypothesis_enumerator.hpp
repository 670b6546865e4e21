// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef hypothesis_enumerator_hpp
#define hypothesis_enumerator_hpp

#include <vector>
#include <cstddef>
#include <functional>

#include <boost/optional.hpp>

#include "config/common.hpp"
#include "basics/pedigree.hpp"
#include "core/types/gene_assignment.hpp"
#include "core/types/trait_assignment.hpp"

namespace heredity {

/**
 HypothesisEnumerator visits every joint configuration of gene counts and traits for a pedigree
 that is consistent with the observed traits. People with an observed trait keep it; everyone
 else takes both values.
 
 Configurations are generated by backtracking over people in pedigree order, so a single pair of
 assignments is reused and only valid for the duration of a visit.
 */
class HypothesisEnumerator
{
public:
    using Visitor = std::function<void(const GeneAssignment&, const TraitAssignment&)>;
    
    HypothesisEnumerator() = delete;
    
    HypothesisEnumerator(const Pedigree& pedigree);
    
    HypothesisEnumerator(const HypothesisEnumerator&)            = default;
    HypothesisEnumerator& operator=(const HypothesisEnumerator&) = default;
    HypothesisEnumerator(HypothesisEnumerator&&)                 = default;
    HypothesisEnumerator& operator=(HypothesisEnumerator&&)      = default;
    
    ~HypothesisEnumerator() = default;
    
    std::size_t num_people() const noexcept;
    
    // 3^people x 2^unobserved, saturating at the maximum std::size_t
    std::size_t num_hypotheses() const noexcept;
    
    // Returns the number of configurations visited
    std::size_t enumerate(const Visitor& visitor) const;
    
private:
    struct Person
    {
        PersonName name;
        boost::optional<bool> trait;
    };
    
    std::vector<Person> people_;
    
    void enumerate(std::size_t idx, GeneAssignment& genes, TraitAssignment& traits,
                   const Visitor& visitor, std::size_t& num_visited) const;
};

} // namespace heredity

#endif
