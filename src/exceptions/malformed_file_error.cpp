// Copyright (c) 2016 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "malformed_file_error.hpp"

#include <utility>
#include <sstream>

namespace heredity {

MalformedFileError::MalformedFileError(Path file)
: file_ {std::move(file)}
{}

MalformedFileError::MalformedFileError(Path file, std::string required_type)
: file_ {std::move(file)}
, required_type_ {std::move(required_type)}
{}

void MalformedFileError::set_reason(std::string reason) noexcept
{
    reason_ = std::move(reason);
}

void MalformedFileError::set_line_number(const std::size_t line) noexcept
{
    line_ = line;
}

const MalformedFileError::Path& MalformedFileError::file() const noexcept
{
    return file_;
}

const boost::optional<std::string>& MalformedFileError::reason() const noexcept
{
    return reason_;
}

std::string MalformedFileError::do_why() const
{
    std::ostringstream ss {};
    ss << "the file you specified " << file_ << ' ';
    if (required_type_) {
        ss << "is not a valid " << *required_type_ << " file";
    } else {
        ss << "is malformed or corrupted";
    }
    if (line_) {
        ss << " (line " << *line_ << ')';
    }
    if (reason_) {
        ss << ": " << *reason_;
    }
    return ss.str();
}

std::string MalformedFileError::do_help() const
{
    if (required_type_) {
        return "check the file is a " + *required_type_ + " file and is not corrupted";
    }
    return "check you did not mistake the command line option";
}

} // namespace heredity
