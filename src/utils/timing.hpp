// Copyright (c) 2015-2020 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef timing_hpp
#define timing_hpp

#include <chrono>
#include <ostream>

namespace heredity { namespace utils {

struct TimeInterval
{
    using TimePoint = std::chrono::system_clock::time_point;
    TimePoint start, end;
};

template <typename T>
auto duration(const TimeInterval& interval)
{
    return std::chrono::duration_cast<T>(interval.end - interval.start);
}

inline std::ostream& operator<<(std::ostream& os, const TimeInterval& interval)
{
    const auto duration_ms = duration<std::chrono::milliseconds>(interval);
    if (duration_ms.count() < 1000) {
        os << duration_ms.count() << "ms";
        return os;
    }
    const auto secs = duration<std::chrono::seconds>(interval).count();
    if (secs < 60) {
        os << secs << 's';
        return os;
    }
    const auto mins = duration<std::chrono::minutes>(interval).count();
    if (mins < 60) {
        os << mins << 'm';
        const auto remainder_secs = secs % 60;
        if (remainder_secs > 0) os << ' ' << remainder_secs << 's';
    } else {
        const auto hours = duration<std::chrono::hours>(interval).count();
        os << hours << 'h';
        const auto remainder_mins = mins % 60;
        if (remainder_mins > 0) os << ' ' << remainder_mins << 'm';
    }
    return os;
}

} // namespace utils
} // namespace heredity

#endif
