// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "gene_count.hpp"

#include <ostream>

namespace heredity {

std::ostream& operator<<(std::ostream& os, const GeneCount count)
{
    os << num_copies(count);
    return os;
}

} // namespace heredity
