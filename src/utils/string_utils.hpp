// Copyright (c) 2015-2019 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef string_utils_hpp
#define string_utils_hpp

#include <vector>
#include <string>
#include <type_traits>
#include <sstream>
#include <iomanip>

namespace heredity { namespace utils {

std::vector<std::string> split(const std::string& str, const char delim);
std::vector<std::string> split(const std::string& str, const std::string delims);

std::string join(const std::vector<std::string>& strings, const std::string delim = "");
std::string join(const std::vector<std::string>& strings, const char delim);

std::string& trim(std::string& str);
std::string trim(const std::string& str);

std::string& capitalise_front(std::string& str) noexcept;
std::string capitalise_front(const std::string& str);
std::string& to_lower(std::string& str) noexcept;
std::string to_lower(const std::string& str);

template <typename T, typename = typename std::enable_if_t<std::is_floating_point<T>::value>>
std::string to_string(const T val, const unsigned precision = 2)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << val;
    return out.str();
}

} // namespace utils
} // namespace heredity

#endif
