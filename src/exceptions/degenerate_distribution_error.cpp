// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "degenerate_distribution_error.hpp"

#include <utility>

namespace heredity {

DegenerateDistributionError::DegenerateDistributionError(std::string person, std::string distribution)
: person_ {std::move(person)}
, distribution_ {std::move(distribution)}
{}

const std::string& DegenerateDistributionError::person() const noexcept
{
    return person_;
}

std::string DegenerateDistributionError::do_where() const
{
    return "MarginalDistributions::normalise";
}

std::string DegenerateDistributionError::do_why() const
{
    return "the " + distribution_ + " distribution of '" + person_ + "' has no probability mass to normalise";
}

} // namespace heredity
