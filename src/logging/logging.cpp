// Copyright (c) 2016 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "logging.hpp"

#include <iostream>
#include <array>
#include <cstddef>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

namespace heredity { namespace logging {

namespace keywords = boost::log::keywords;
namespace expr     = boost::log::expressions;

std::ostream& operator<<(std::ostream& os, const severity_level level)
{
    static const std::array<const char*, 6> labels {{"TRCE", "DEBG", "INFO", "WARN", "EROR", "FATL"}};
    os << labels[static_cast<std::size_t>(level)];
    return os;
}

namespace {

boost::log::formatter record_format()
{
    return expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
            << " <" << severity << "> " << expr::smessage;
}

} // namespace

void init(boost::optional<boost::filesystem::path> debug_log,
          boost::optional<boost::filesystem::path> trace_log)
{
    boost::log::add_console_log(std::clog,
                                keywords::filter = severity >= severity_level::info,
                                keywords::format = record_format());
    if (debug_log) {
        boost::log::add_file_log(keywords::file_name = debug_log->string(),
                                 keywords::filter = severity >= severity_level::debug,
                                 keywords::format = record_format());
    }
    if (trace_log) {
        boost::log::add_file_log(keywords::file_name = trace_log->string(),
                                 keywords::format = record_format());
    }
    boost::log::add_common_attributes();
}

} // namespace logging
} // namespace heredity
