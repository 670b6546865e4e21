// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "report_writer.hpp"

#include <utility>
#include <string>
#include <iterator>
#include <algorithm>
#include <memory>
#include <initializer_list>

#include "core/types/gene_count.hpp"
#include "exceptions/unwritable_file_error.hpp"
#include "utils/string_utils.hpp"

namespace heredity {

namespace {

class UnwritableReport : public UnwritableFileError
{
    std::string do_where() const override { return "ReportWriter"; }
public:
    UnwritableReport(boost::filesystem::path file, std::string reason)
    : UnwritableFileError {std::move(file), std::string {"report"}}
    {
        set_reason(std::move(reason));
    }
};

} // namespace

constexpr unsigned ReportWriter::defaultPrecision;

ReportWriter::ReportWriter(std::ostream& out, const unsigned precision)
: path_ {}
, file_ {}
, out_ {std::addressof(out)}
, precision_ {precision}
{}

ReportWriter::ReportWriter(Path file, const unsigned precision)
: path_ {std::move(file)}
, file_ {std::make_unique<std::ofstream>(path_->string())}
, out_ {file_.get()}
, precision_ {precision}
{
    if (!file_->is_open()) {
        throw UnwritableReport {*path_, "the file could not be opened"};
    }
}

const boost::optional<ReportWriter::Path>& ReportWriter::path() const noexcept
{
    return path_;
}

unsigned ReportWriter::precision() const noexcept
{
    return precision_;
}

void ReportWriter::write(const MarginalDistributions& distributions)
{
    for (const auto& person : distributions.people()) {
        write(person, distributions);
    }
    out_->flush();
    if (!*out_ && path_) {
        throw UnwritableReport {*path_, "writing failed part way through"};
    }
}

// private methods

void ReportWriter::write(const PersonName& person, const MarginalDistributions& distributions)
{
    auto& out = *out_;
    out << person << ":\n";
    out << "  Gene:\n";
    std::for_each(std::crbegin(all_gene_counts), std::crend(all_gene_counts), [&] (const GeneCount count) {
        out << "    " << count << ": " << utils::to_string(distributions.probability_of(person, count), precision_) << '\n';
    });
    out << "  Trait:\n";
    for (const bool has_trait : {true, false}) {
        out << "    " << (has_trait ? "True" : "False") << ": "
            << utils::to_string(distributions.probability_of_trait(person, has_trait), precision_) << '\n';
    }
}

} // namespace heredity
