// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "unknown_person_error.hpp"

#include <utility>

namespace heredity {

UnknownPersonError::UnknownPersonError(std::string person, std::string where)
: person_ {std::move(person)}
, where_ {std::move(where)}
{}

const std::string& UnknownPersonError::person() const noexcept
{
    return person_;
}

std::string UnknownPersonError::do_where() const
{
    return where_;
}

std::string UnknownPersonError::do_why() const
{
    return "the person '" + person_ + "' is not a member of the pedigree";
}

} // namespace heredity
