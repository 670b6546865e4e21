// Copyright (c) 2015-2019 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef inference_components_hpp
#define inference_components_hpp

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "config/common.hpp"
#include "config/option_parser.hpp"
#include "basics/pedigree.hpp"
#include "core/models/probability_tables.hpp"
#include "io/report/report_writer.hpp"

namespace heredity {

class InferenceComponents
{
public:
    using Path = boost::filesystem::path;
    
    InferenceComponents() = delete;
    
    InferenceComponents(Pedigree&& pedigree, ProbabilityTables tables, ReportWriter&& output,
                        const options::OptionMap& options);
    
    InferenceComponents(const InferenceComponents&)            = delete;
    InferenceComponents& operator=(const InferenceComponents&) = delete;
    InferenceComponents(InferenceComponents&&)                 = default;
    InferenceComponents& operator=(InferenceComponents&&)      = default;
    
    ~InferenceComponents() = default;
    
    const Pedigree& pedigree() const noexcept;
    const ProbabilityTables& probability_tables() const noexcept;
    ReportWriter& output() noexcept;
    const ReportWriter& output() const noexcept;
    const Path& data_path() const noexcept;
    
private:
    Pedigree pedigree_;
    ProbabilityTables tables_;
    ReportWriter output_;
    Path data_path_;
};

InferenceComponents collate_inference_components(const options::OptionMap& options);

bool validate(const InferenceComponents& components);

} // namespace heredity

#endif
