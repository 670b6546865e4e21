// Copyright (c) 2017 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "unwritable_file_error.hpp"

#include <utility>
#include <sstream>

namespace heredity {

UnwritableFileError::UnwritableFileError(Path file, boost::optional<std::string> description)
: file_ {std::move(file)}
, description_ {std::move(description)}
{}

void UnwritableFileError::set_reason(std::string reason) noexcept
{
    reason_ = std::move(reason);
}

const UnwritableFileError::Path& UnwritableFileError::file() const noexcept
{
    return file_;
}

std::string UnwritableFileError::do_why() const
{
    std::ostringstream ss {};
    ss << "could not write the " << (description_ ? *description_ + " " : std::string {}) << "file " << file_;
    if (reason_) ss << " (" << *reason_ << ")";
    return ss.str();
}

std::string UnwritableFileError::do_help() const
{
    return "check the directory exists and you have permission to write to it";
}

} // namespace heredity
