// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "config.hpp"

#include <ostream>
#include <sstream>

#include <boost/version.hpp>

#ifndef HEREDITY_VERSION_MAJOR
#define HEREDITY_VERSION_MAJOR 0
#endif
#ifndef HEREDITY_VERSION_MINOR
#define HEREDITY_VERSION_MINOR 1
#endif
#ifndef HEREDITY_VERSION_PATCH
#define HEREDITY_VERSION_PATCH 0
#endif
#ifndef HEREDITY_VERSION_RELEASE
#define HEREDITY_VERSION_RELEASE ""
#endif

namespace heredity { namespace config {

static boost::optional<std::string> get_release_name()
{
    std::string name {HEREDITY_VERSION_RELEASE};
    if (name.empty()) {
        return boost::none;
    } else {
        return name;
    }
}

const VersionNumber Version {HEREDITY_VERSION_MAJOR,
                             HEREDITY_VERSION_MINOR,
                             HEREDITY_VERSION_PATCH,
                             get_release_name()};

std::ostream& operator<<(std::ostream& os, const VersionNumber& version)
{
    os << version.major << '.' << version.minor;
    if (version.patch) os << '.' << *version.patch;
    if (version.name) os << '-' << *version.name;
    return os;
}

std::string to_string(const VersionNumber& version)
{
    std::ostringstream ss {};
    ss << version;
    return ss.str();
}

static std::string get_boost_version()
{
    std::ostringstream ss {};
    ss << BOOST_VERSION / 100000 << '.' << BOOST_VERSION / 100 % 1000 << '.' << BOOST_VERSION % 100;
    return ss.str();
}

const std::string BoostVersion {get_boost_version()};

const std::string BugReport {"the heredity developers"};

const std::string CopyrightNotice {"Copyright (c) 2015-2021 University of Oxford"};

const unsigned CommandLineWidth {72};

} // namespace config
} // namespace heredity
