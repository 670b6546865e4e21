// Copyright (c) 2016 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef main_logging_hpp
#define main_logging_hpp

#include "config/option_parser.hpp"

namespace heredity {

// Banner with the program version, always at info level
void log_program_startup();

// Debug level only
void log_command_line_options(const options::OptionMap& options);

void log_program_end();

} // namespace heredity

#endif
