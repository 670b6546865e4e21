// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef maths_hpp
#define maths_hpp

#include <numeric>
#include <algorithm>
#include <type_traits>
#include <iterator>

namespace heredity { namespace maths {

template <typename T, typename = typename std::enable_if_t<std::is_floating_point<T>::value>>
constexpr bool is_probability(const T x) noexcept
{
    return x >= 0 && x <= 1;
}

template <typename InputIt>
auto sum(InputIt first, InputIt last)
{
    using T = typename std::iterator_traits<InputIt>::value_type;
    return std::accumulate(first, last, T {});
}

template <typename Range>
auto sum(const Range& values)
{
    return sum(std::cbegin(values), std::cend(values));
}

template <typename ForwardIterator>
auto normalise(const ForwardIterator first, const ForwardIterator last)
{
    using T = typename std::iterator_traits<ForwardIterator>::value_type;
    const auto norm = std::accumulate(first, last, T {});
    if (norm > 0) std::for_each(first, last, [norm] (auto& value) { value /= norm; });
    return norm;
}

template <typename Range>
auto normalise(Range& values)
{
    return normalise(std::begin(values), std::end(values));
}

} // namespace maths
} // namespace heredity

#endif
