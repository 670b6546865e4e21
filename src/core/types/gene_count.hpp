// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef gene_count_hpp
#define gene_count_hpp

#include <array>
#include <cstddef>
#include <iosfwd>

namespace heredity {

enum class GeneCount { zero, one, two };

constexpr std::size_t num_gene_counts {3};

constexpr std::array<GeneCount, num_gene_counts> all_gene_counts {{GeneCount::zero, GeneCount::one, GeneCount::two}};

constexpr std::size_t index_of(const GeneCount count) noexcept
{
    return static_cast<std::size_t>(count);
}

constexpr unsigned num_copies(const GeneCount count) noexcept
{
    return static_cast<unsigned>(count);
}

std::ostream& operator<<(std::ostream& os, GeneCount count);

} // namespace heredity

#endif
