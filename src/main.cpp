// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <iostream>
#include <cstdlib>
#include <chrono>
#include <exception>
#include <new>
#include <vector>
#include <string>

#include "config/common.hpp"
#include "logging/logging.hpp"
#include "logging/main_logging.hpp"
#include "logging/error_handler.hpp"
#include "config/option_parser.hpp"
#include "config/option_collation.hpp"
#include "core/inference_components.hpp"
#include "core/heredity.hpp"
#include "utils/timing.hpp"
#include "utils/string_utils.hpp"
#include "exceptions/error.hpp"

using namespace heredity;
using namespace heredity::options;

namespace {

std::string to_string(const int argc, const char** argv)
{
    return utils::join(std::vector<std::string> {argv, argv + argc}, ' ');
}

void init_common(const OptionMap& options)
{
    logging::init(get_debug_log_file_name(options), get_trace_log_file_name(options));
    DEBUG_MODE = is_debug_mode(options);
    TRACE_MODE = is_trace_mode(options);
}

int run(const OptionMap& options, const int argc, const char** argv)
{
    init_common(options);
    log_program_startup();
    log_command_line_options(options);
    logging::InfoLogger info_log {};
    const auto start = std::chrono::system_clock::now();
    auto components = collate_inference_components(options);
    const auto end = std::chrono::system_clock::now();
    stream(info_log) << "Done initialising inference components in " << utils::TimeInterval {start, end};
    if (!validate(components)) {
        log_program_end();
        return EXIT_FAILURE;
    }
    run_heredity(components, {to_string(argc, argv), heredity::options::to_string(options, true, false)});
    log_program_end();
    return EXIT_SUCCESS;
}

// Must be called from inside a catch block
int handle_current_exception()
{
    try {
        throw;
    } catch (const Error& e) {
        log_error(e);
    } catch (const std::bad_alloc& e) {
        log_error(e);
    } catch (const std::exception& e) {
        log_error(e);
    } catch (...) {
        log_unknown_error();
    }
    log_program_end();
    return EXIT_FAILURE;
}

} // namespace

int main(const int argc, const char** argv)
{
    OptionMap options;
    try {
        options = parse_options(argc, argv);
    } catch (...) {
        // logging is not yet configured
        logging::init();
        log_program_startup();
        return handle_current_exception();
    }
    if (!is_run_command(options)) return EXIT_SUCCESS;
    try {
        return run(options, argc, argv);
    } catch (...) {
        return handle_current_exception();
    }
}
