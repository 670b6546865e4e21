// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "pedigree.hpp"

#include <utility>
#include <algorithm>
#include <iterator>
#include <stdexcept>

#include <boost/graph/topological_sort.hpp>
#include <boost/graph/exception.hpp>

#include "exceptions/unknown_person_error.hpp"

namespace heredity {

// public methods

Pedigree::Pedigree(std::size_t pedigree_size_hint)
{
    members_.reserve(pedigree_size_hint);
}

void Pedigree::add_member(Member member)
{
    if (is_member(member.name)) {
        throw std::invalid_argument {"Pedigree: duplicate member " + member.name};
    }
    const auto vertex = boost::add_vertex(member, tree_);
    members_.emplace(std::move(member.name), vertex);
}

void Pedigree::set_parents(const PersonName& child, const PersonName& mother, const PersonName& father)
{
    const auto child_vertex  = get_vertex(child);
    const auto mother_vertex = get_vertex(mother);
    const auto father_vertex = get_vertex(father);
    if (mother_vertex == father_vertex) {
        throw std::invalid_argument {"Pedigree: " + child + " has the same mother and father"};
    }
    if (boost::in_degree(child_vertex, tree_) > 0) {
        throw std::invalid_argument {"Pedigree: parents of " + child + " are already set"};
    }
    boost::add_edge(mother_vertex, child_vertex, Relationship {Relationship::Parent::mother}, tree_);
    boost::add_edge(father_vertex, child_vertex, Relationship {Relationship::Parent::father}, tree_);
}

bool Pedigree::is_member(const PersonName& person) const noexcept
{
    return members_.count(person) == 1;
}

bool Pedigree::is_founder(const PersonName& person) const
{
    return !has_parents(person);
}

bool Pedigree::has_parents(const PersonName& person) const
{
    return boost::in_degree(get_vertex(person), tree_) > 0;
}

boost::optional<Pedigree::Parents> Pedigree::parents_of(const PersonName& child) const
{
    const auto mother = mother_of(child);
    const auto father = father_of(child);
    if (mother && father) {
        return Parents {*mother, *father};
    } else {
        return boost::none;
    }
}

boost::optional<const PersonName&> Pedigree::mother_of(const PersonName& child) const
{
    return parent_of(child, Relationship::Parent::mother);
}

boost::optional<const PersonName&> Pedigree::father_of(const PersonName& child) const
{
    return parent_of(child, Relationship::Parent::father);
}

boost::optional<bool> Pedigree::observed_trait(const PersonName& person) const
{
    return tree_[get_vertex(person)].trait;
}

std::vector<PersonName> Pedigree::members() const
{
    const auto vertices = boost::vertices(tree_);
    std::vector<PersonName> result {};
    result.reserve(size());
    std::transform(vertices.first, vertices.second, std::back_inserter(result),
                   [this] (const Vertex& v) { return tree_[v].name; });
    return result;
}

bool Pedigree::is_acyclic() const
{
    std::vector<Vertex> order {};
    order.reserve(size());
    try {
        boost::topological_sort(tree_, std::back_inserter(order));
    } catch (const boost::not_a_dag&) {
        return false;
    }
    return true;
}

bool Pedigree::is_empty() const noexcept
{
    return members_.empty();
}

std::size_t Pedigree::size() const noexcept
{
    return members_.size();
}

void Pedigree::clear() noexcept
{
    tree_.clear();
    members_.clear();
}

// private methods

Pedigree::Vertex Pedigree::get_vertex(const PersonName& person) const
{
    const auto itr = members_.find(person);
    if (itr == std::cend(members_)) {
        throw UnknownPersonError {person, "Pedigree"};
    }
    return itr->second;
}

boost::optional<const PersonName&> Pedigree::parent_of(const PersonName& child, const Relationship::Parent parent) const
{
    const auto parents = boost::in_edges(get_vertex(child), tree_);
    const auto itr = std::find_if(parents.first, parents.second, [&] (const Edge& e) { return tree_[e].parent == parent; });
    if (itr == parents.second) {
        return boost::none;
    } else {
        return tree_[boost::source(*itr, tree_)].name;
    }
}

// non-member methods

std::vector<PersonName> get_founders(const Pedigree& pedigree)
{
    auto result = pedigree.members();
    result.erase(std::remove_if(std::begin(result), std::end(result),
                                [&] (const auto& person) { return pedigree.has_parents(person); }),
                 std::end(result));
    return result;
}

std::size_t count_unobserved(const Pedigree& pedigree)
{
    const auto members = pedigree.members();
    return std::count_if(std::cbegin(members), std::cend(members),
                         [&] (const auto& person) { return !pedigree.observed_trait(person); });
}

} // namespace heredity
