// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef config_hpp
#define config_hpp

#include <string>
#include <iosfwd>

#include <boost/optional.hpp>

namespace heredity { namespace config {

struct VersionNumber
{
    unsigned short major, minor;
    boost::optional<unsigned short> patch = boost::none;
    boost::optional<std::string> name = boost::none;
};

extern const VersionNumber Version;

std::ostream& operator<<(std::ostream& os, const VersionNumber& version);

std::string to_string(const VersionNumber& version);

extern const std::string BoostVersion;

extern const std::string BugReport;

extern const std::string CopyrightNotice;

extern const unsigned CommandLineWidth;

} // namespace config
} // namespace heredity

#endif
