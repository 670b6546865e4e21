// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef gene_assignment_hpp
#define gene_assignment_hpp

#include <unordered_map>
#include <string>
#include <cstddef>

#include "config/common.hpp"
#include "exceptions/program_error.hpp"
#include "gene_count.hpp"

namespace heredity {

/**
 A GeneAssignment is one hypothesised world state for the gene count of every person. Anybody
 not explicitly assigned has zero copies.
 */
class GeneAssignment
{
    using CountMap = std::unordered_map<PersonName, GeneCount>;
    
public:
    using const_iterator = CountMap::const_iterator;
    
    GeneAssignment() = default;
    
    // Throws OverlappingGeneSets if a person is in both sets
    GeneAssignment(const PersonSet& one_copy, const PersonSet& two_copies);
    
    GeneAssignment(const GeneAssignment&)            = default;
    GeneAssignment& operator=(const GeneAssignment&) = default;
    GeneAssignment(GeneAssignment&&)                 = default;
    GeneAssignment& operator=(GeneAssignment&&)      = default;
    
    ~GeneAssignment() = default;
    
    void assign(const PersonName& person, GeneCount count);
    
    GeneCount count_of(const PersonName& person) const noexcept;
    
    std::size_t size() const noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;
    
private:
    CountMap counts_;
};

class OverlappingGeneSets : public ProgramError
{
public:
    OverlappingGeneSets(PersonName person);
    
    const PersonName& person() const noexcept;
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    
    PersonName person_;
};

} // namespace heredity

#endif
