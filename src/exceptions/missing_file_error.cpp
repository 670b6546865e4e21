// Copyright (c) 2016 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "missing_file_error.hpp"

#include <utility>
#include <sstream>

namespace heredity {

MissingFileError::MissingFileError(Path file, boost::optional<std::string> description)
: file_ {std::move(file)}
, description_ {std::move(description)}
{}

const MissingFileError::Path& MissingFileError::file() const noexcept
{
    return file_;
}

std::string MissingFileError::do_why() const
{
    std::ostringstream ss {};
    ss << "there is no " << (description_ ? *description_ + " " : std::string {}) << "file at " << file_;
    return ss.str();
}

std::string MissingFileError::do_help() const
{
    return "check the path, relative paths are resolved against the working directory";
}

} // namespace heredity
