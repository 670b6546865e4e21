// Copyright (c) 2015-2018 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "string_utils.hpp"

#include <array>
#include <algorithm>
#include <iterator>
#include <cctype>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace heredity { namespace utils {

std::vector<std::string> split(const std::string& str, const char delim)
{
    const std::array<char, 2> delims {delim, '\0'};
    return split(str, std::string {delims.data()});
}

std::vector<std::string> split(const std::string& str, const std::string delims)
{
    std::vector<std::string> elems;
    boost::split(elems, str, boost::is_any_of(delims));
    return elems;
}

std::string join(const std::vector<std::string>& strings, const std::string delim)
{
    return boost::algorithm::join(strings, delim);
}

std::string join(const std::vector<std::string>& strings, const char delim)
{
    const std::array<char, 2> Delim {delim, '\0'};
    return join(strings, Delim.data());
}

std::string& trim(std::string& str)
{
    boost::algorithm::trim(str);
    return str;
}

std::string trim(const std::string& str)
{
    return boost::algorithm::trim_copy(str);
}

std::string& capitalise_front(std::string& str) noexcept
{
    if (!str.empty()) str.front() = std::toupper(str.front());
    return str;
}

std::string capitalise_front(const std::string& str)
{
    auto result = str;
    return capitalise_front(result);
}

std::string& to_lower(std::string& str) noexcept
{
    std::transform(std::cbegin(str), std::cend(str), std::begin(str), [] (char c) { return std::tolower(c); });
    return str;
}

std::string to_lower(const std::string& str)
{
    std::string result(str.size(), char {});
    std::transform(std::cbegin(str), std::cend(str), std::begin(result), [] (char c) { return std::tolower(c); });
    return result;
}

} // namespace utils
} // namespace heredity
