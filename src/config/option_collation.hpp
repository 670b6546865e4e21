// Copyright (c) 2015-2019 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_collation_hpp
#define option_collation_hpp

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include "common.hpp"
#include "option_parser.hpp"
#include "basics/pedigree.hpp"
#include "core/models/probability_tables.hpp"

namespace fs = boost::filesystem;

namespace heredity { namespace options {

bool is_run_command(const OptionMap& options);

bool is_debug_mode(const OptionMap& options);
bool is_trace_mode(const OptionMap& options);

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options);
boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options);

fs::path get_data_path(const OptionMap& options);

Pedigree read_pedigree(const OptionMap& options);

ProbabilityTables get_probability_tables(const OptionMap& options);

boost::optional<fs::path> get_output_path(const OptionMap& options);

unsigned get_report_precision(const OptionMap& options);

} // namespace options
} // namespace heredity

#endif
