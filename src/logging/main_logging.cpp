// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "main_logging.hpp"

#include <string>

#include "config/config.hpp"
#include "config/common.hpp"
#include "logging.hpp"

namespace heredity {

namespace {

const std::string& banner()
{
    static const std::string result(config::CommandLineWidth, '-');
    return result;
}

} // namespace

void log_program_startup()
{
    logging::InfoLogger log {};
    log << banner();
    stream(log) << "heredity v" << config::Version << " (Boost " << config::BoostVersion << ')';
    log << config::CopyrightNotice;
    log << banner();
}

void log_command_line_options(const options::OptionMap& options)
{
    auto debug_log = logging::get_debug_log();
    if (debug_log) {
        stream(*debug_log) << "Program options:\n" << options::to_string(options);
    }
}

void log_program_end()
{
    logging::InfoLogger log {};
    log << banner();
}

} // namespace heredity
