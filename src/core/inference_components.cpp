// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "inference_components.hpp"

#include <iostream>
#include <utility>

#include "config/option_collation.hpp"
#include "logging/logging.hpp"

namespace heredity {

InferenceComponents::InferenceComponents(Pedigree&& pedigree, ProbabilityTables tables, ReportWriter&& output,
                                         const options::OptionMap& options)
: pedigree_ {std::move(pedigree)}
, tables_ {std::move(tables)}
, output_ {std::move(output)}
, data_path_ {options::get_data_path(options)}
{}

const Pedigree& InferenceComponents::pedigree() const noexcept
{
    return pedigree_;
}

const ProbabilityTables& InferenceComponents::probability_tables() const noexcept
{
    return tables_;
}

ReportWriter& InferenceComponents::output() noexcept
{
    return output_;
}

const ReportWriter& InferenceComponents::output() const noexcept
{
    return output_;
}

const InferenceComponents::Path& InferenceComponents::data_path() const noexcept
{
    return data_path_;
}

// non-member methods

namespace {

ReportWriter make_report_writer(const options::OptionMap& options)
{
    const auto precision = options::get_report_precision(options);
    const auto output_path = options::get_output_path(options);
    if (output_path) {
        return ReportWriter {*output_path, precision};
    } else {
        return ReportWriter {std::cout, precision};
    }
}

} // namespace

InferenceComponents collate_inference_components(const options::OptionMap& options)
{
    // Check these first to avoid creating the output file on error
    auto tables   = options::get_probability_tables(options);
    auto pedigree = options::read_pedigree(options);
    auto output   = make_report_writer(options);
    return InferenceComponents {
        std::move(pedigree),
        std::move(tables),
        std::move(output),
        options
    };
}

bool validate(const InferenceComponents& components)
{
    if (components.pedigree().is_empty()) {
        logging::WarningLogger log {};
        stream(log) << "No people were found in " << components.data_path() << " - at least one is required for inference";
        return false;
    }
    return true;
}

} // namespace heredity
