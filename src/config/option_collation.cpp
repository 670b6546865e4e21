// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_collation.hpp"

#include <string>
#include <vector>
#include <array>
#include <utility>
#include <algorithm>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>

#include "utils/path_utils.hpp"
#include "logging/logging.hpp"
#include "io/pedigree/pedigree_reader.hpp"
#include "exceptions/unwritable_file_error.hpp"

namespace heredity { namespace options {

bool is_set(const std::string& option, const OptionMap& options) noexcept
{
    return options.count(option) == 1;
}

// unsigned are banned from the option map to prevent user input errors, but once the option
// map is passed they are all safe
unsigned as_unsigned(const std::string& option, const OptionMap& options)
{
    return static_cast<unsigned>(options.at(option).as<int>());
}

bool is_run_command(const OptionMap& options)
{
    return !is_set("help", options) && !is_set("version", options);
}

bool is_debug_mode(const OptionMap& options)
{
    return is_set("debug", options);
}

bool is_trace_mode(const OptionMap& options)
{
    return is_set("trace", options);
}

namespace {

fs::path resolve_path(const fs::path& path, const OptionMap& options)
{
    boost::optional<fs::path> working_directory {};
    if (is_set("working-directory", options)) {
        working_directory = options.at("working-directory").as<fs::path>();
    }
    return ::heredity::resolve_path(path, get_working_directory(working_directory));
}

class UnwritableReportFile : public UnwritableFileError
{
    std::string do_where() const override
    {
        return "get_output_path";
    }
public:
    UnwritableReportFile(fs::path p) : UnwritableFileError {std::move(p), std::string {"report"}} {}
};

} // namespace

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options)
{
    if (is_debug_mode(options)) {
        return resolve_path(options.at("debug").as<fs::path>(), options);
    } else {
        return boost::none;
    }
}

boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options)
{
    if (is_trace_mode(options)) {
        return resolve_path(options.at("trace").as<fs::path>(), options);
    } else {
        return boost::none;
    }
}

fs::path get_data_path(const OptionMap& options)
{
    return resolve_path(options.at("data").as<fs::path>(), options);
}

Pedigree read_pedigree(const OptionMap& options)
{
    return io::read_pedigree(get_data_path(options));
}

ProbabilityTables get_probability_tables(const OptionMap& options)
{
    auto gene_prior = make_default_probability_tables().gene_prior;
    if (is_set("gene-prior", options)) {
        const auto& values = options.at("gene-prior").as<std::vector<double>>();
        std::copy_n(std::cbegin(values), std::min(values.size(), gene_prior.size()), std::begin(gene_prior));
    }
    const std::array<Probability, num_gene_counts> trait_probabilities {{
        options.at("trait-given-zero-copies").as<double>(),
        options.at("trait-given-one-copy").as<double>(),
        options.at("trait-given-two-copies").as<double>()
    }};
    auto result = make_probability_tables(gene_prior, options.at("mutation-rate").as<double>(), trait_probabilities);
    validate(result);
    return result;
}

boost::optional<fs::path> get_output_path(const OptionMap& options)
{
    if (is_set("output", options)) {
        auto result = resolve_path(options.at("output").as<fs::path>(), options);
        if (!is_writable_location(result)) {
            throw UnwritableReportFile {result};
        }
        return result;
    }
    return boost::none;
}

unsigned get_report_precision(const OptionMap& options)
{
    return as_unsigned("precision", options);
}

} // namespace options
} // namespace heredity
