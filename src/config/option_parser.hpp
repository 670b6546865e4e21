// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_parser_hpp
#define option_parser_hpp

#include <string>
#include <iosfwd>

#include <boost/program_options.hpp>

namespace heredity { namespace options {

using OptionMap = boost::program_options::variables_map;

OptionMap parse_options(int argc, const char** argv);

std::ostream& operator<<(std::ostream& os, const OptionMap& options);
std::string to_string(const OptionMap& options, bool one_line = false, bool mark_modified = true);

} // namespace options
} // namespace heredity

#endif
