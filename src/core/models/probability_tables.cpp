// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "probability_tables.hpp"

#include <cmath>
#include <ostream>
#include <sstream>
#include <utility>
#include <algorithm>

#include "utils/maths.hpp"

namespace heredity {

ProbabilityTables make_default_probability_tables()
{
    return make_probability_tables({0.96, 0.03, 0.01}, 0.01, {0.01, 0.56, 0.65});
}

ProbabilityTables make_probability_tables(ProbabilityTables::GenePrior gene_prior,
                                          const Probability mutation_rate,
                                          const std::array<Probability, num_gene_counts> trait_probabilities)
{
    ProbabilityTables result {};
    result.gene_prior = std::move(gene_prior);
    result.mutation_rate = mutation_rate;
    for (const auto count : all_gene_counts) {
        const auto p = trait_probabilities[index_of(count)];
        result.trait_given_genes[index_of(count)] = {1.0 - p, p};
    }
    return result;
}

Probability prior_probability(const ProbabilityTables& tables, const GeneCount count) noexcept
{
    return tables.gene_prior[index_of(count)];
}

Probability trait_probability(const ProbabilityTables& tables, const GeneCount count, const bool has_trait) noexcept
{
    return tables.trait_given_genes[index_of(count)][has_trait];
}

InvalidProbabilityTables::InvalidProbabilityTables(std::string reason) : reason_ {std::move(reason)} {}

std::string InvalidProbabilityTables::do_where() const
{
    return "validate";
}

std::string InvalidProbabilityTables::do_why() const
{
    return reason_;
}

std::string InvalidProbabilityTables::do_help() const
{
    return "check the probability options you specified";
}

namespace {

constexpr Probability sum_tolerance {1e-9};

template <typename Range>
bool sums_to_one(const Range& probabilities)
{
    return std::abs(maths::sum(probabilities) - 1.0) < sum_tolerance;
}

template <typename Range>
bool all_probabilities(const Range& values)
{
    return std::all_of(std::cbegin(values), std::cend(values), [] (auto p) { return maths::is_probability(p); });
}

} // namespace

void validate(const ProbabilityTables& tables)
{
    if (!all_probabilities(tables.gene_prior)) {
        throw InvalidProbabilityTables {"the gene prior contains values outside [0, 1]"};
    }
    if (!sums_to_one(tables.gene_prior)) {
        throw InvalidProbabilityTables {"the gene prior does not sum to one"};
    }
    if (!maths::is_probability(tables.mutation_rate)) {
        throw InvalidProbabilityTables {"the mutation rate is not in [0, 1]"};
    }
    for (const auto count : all_gene_counts) {
        const auto& trait_distribution = tables.trait_given_genes[index_of(count)];
        std::ostringstream ss {};
        ss << "the trait distribution given " << count << " gene copies ";
        if (!all_probabilities(trait_distribution)) {
            ss << "contains values outside [0, 1]";
            throw InvalidProbabilityTables {ss.str()};
        }
        if (!sums_to_one(trait_distribution)) {
            ss << "does not sum to one";
            throw InvalidProbabilityTables {ss.str()};
        }
    }
}

std::ostream& operator<<(std::ostream& os, const ProbabilityTables& tables)
{
    os << "gene prior {";
    for (const auto count : all_gene_counts) {
        if (count != GeneCount::zero) os << ", ";
        os << count << ": " << prior_probability(tables, count);
    }
    os << "}; mutation rate " << tables.mutation_rate << "; p(trait | genes) {";
    for (const auto count : all_gene_counts) {
        if (count != GeneCount::zero) os << ", ";
        os << count << ": " << trait_probability(tables, count, true);
    }
    os << '}';
    return os;
}

} // namespace heredity
