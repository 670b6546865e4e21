// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef pedigree_hpp
#define pedigree_hpp

#include <vector>
#include <unordered_map>
#include <cstddef>

#include <boost/graph/adjacency_list.hpp>
#include <boost/optional.hpp>

#include "config/common.hpp"

namespace heredity {

/**
 A Pedigree is a set of named people linked by parent -> child relationships. Each person has
 either no parents (a founder) or both a mother and a father, and may have an observed trait.
 
 Members are kept in the order they were added.
 */
class Pedigree
{
public:
    struct Member
    {
        PersonName name;
        boost::optional<bool> trait = boost::none; // observed trait, none if unknown
    };
    
    struct Parents
    {
        PersonName mother, father;
    };
    
    Pedigree() = default;
    Pedigree(std::size_t pedigree_size_hint);
    
    Pedigree(const Pedigree&)            = default;
    Pedigree& operator=(const Pedigree&) = default;
    Pedigree(Pedigree&&)                 = default;
    Pedigree& operator=(Pedigree&&)      = default;
    
    ~Pedigree() = default;
    
    void add_member(Member member);
    void set_parents(const PersonName& child, const PersonName& mother, const PersonName& father);
    
    bool is_member(const PersonName& person) const noexcept;
    bool is_founder(const PersonName& person) const;
    bool has_parents(const PersonName& person) const;
    
    boost::optional<Parents> parents_of(const PersonName& child) const;
    boost::optional<const PersonName&> mother_of(const PersonName& child) const;
    boost::optional<const PersonName&> father_of(const PersonName& child) const;
    boost::optional<bool> observed_trait(const PersonName& person) const;
    
    std::vector<PersonName> members() const;
    
    // false if somebody is their own ancestor
    bool is_acyclic() const;
    
    bool is_empty() const noexcept;
    std::size_t size() const noexcept;
    void clear() noexcept;
    
private:
    struct Relationship
    {
        enum class Parent { mother, father };
        Parent parent;
    };
    
    using Tree = boost::adjacency_list<boost::vecS, boost::vecS, boost::bidirectionalS, Member, Relationship>;
    using Vertex = typename boost::graph_traits<Tree>::vertex_descriptor;
    using Edge   = typename boost::graph_traits<Tree>::edge_descriptor;
    
    Tree tree_;
    std::unordered_map<PersonName, Vertex> members_;
    
    Vertex get_vertex(const PersonName& person) const;
    boost::optional<const PersonName&> parent_of(const PersonName& child, Relationship::Parent parent) const;
};

std::vector<PersonName> get_founders(const Pedigree& pedigree);

std::size_t count_unobserved(const Pedigree& pedigree);

} // namespace heredity

#endif
