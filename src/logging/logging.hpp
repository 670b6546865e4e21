// Copyright (c) 2016 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef logging_hpp
#define logging_hpp

#include <iostream>
#include <functional>
#include <sstream>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/expressions/keyword.hpp>

namespace heredity { namespace logging {

enum class severity_level { trace, debug, info, warning, error, fatal };

std::ostream& operator<<(std::ostream& os, severity_level level);

using SeverityLogger = boost::log::sources::severity_logger<severity_level>;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(logger, SeverityLogger)

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

/**
 Console output is info and above. The debug log gets everything except trace records,
 the trace log gets everything.
 */
void init(boost::optional<boost::filesystem::path> debug_log = boost::none,
          boost::optional<boost::filesystem::path> trace_log = boost::none);

template <severity_level Level>
class Logger
{
public:
    Logger() : lg_ {logger::get()} {}
    
    template <typename T> void write(const T& msg) { BOOST_LOG_SEV(lg_, Level) << msg; }
    
private:
    SeverityLogger lg_;
};

template <severity_level Level, typename T>
Logger<Level>& operator<<(Logger<Level>& lg, const T& msg)
{
    lg.write(msg);
    return lg;
}

using TraceLogger   = Logger<severity_level::trace>;
using DebugLogger   = Logger<severity_level::debug>;
using InfoLogger    = Logger<severity_level::info>;
using WarningLogger = Logger<severity_level::warning>;
using ErrorLogger   = Logger<severity_level::error>;
using FatalLogger   = Logger<severity_level::fatal>;

// Buffers a multi-line message and writes it as a single record when destroyed
template <typename Log>
class LogStream
{
public:
    LogStream() = delete;
    
    LogStream(Log& log, const unsigned indent_size = 0)
    : log_ {log}
    , msg_ {}
    , newline_replacement_ {indent_size > 0 ? '\n' + std::string(indent_size, ' ') : std::string {}}
    {}
    
    LogStream(const LogStream&)            = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&&)                 = default;
    LogStream& operator=(LogStream&&)      = default;
    
    ~LogStream()
    {
        auto str = msg_.str();
        while (!str.empty() && str.back() == '\n') str.pop_back();
        if (!newline_replacement_.empty()) boost::replace_all(str, "\n", newline_replacement_);
        log_.get() << str;
    }
    
    template <typename M> void write(const M& msg) { msg_ << msg; }
    
private:
    std::reference_wrapper<Log> log_;
    std::ostringstream msg_;
    std::string newline_replacement_;
};

template <typename Log>
auto stream(Log& log, const unsigned newline_indent = 4)
{
    return LogStream<Log> {log, newline_indent};
}

template <typename Log, typename M>
LogStream<Log>& operator<<(LogStream<Log>& ls, const M& msg)
{
    ls.write(msg);
    return ls;
}

template <typename Log, typename M>
LogStream<Log>& operator<<(LogStream<Log>&& ls, const M& msg)
{
    ls.write(msg);
    return ls;
}

} // namespace logging
} // namespace heredity

#endif
