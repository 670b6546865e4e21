// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef report_writer_hpp
#define report_writer_hpp

#include <ostream>
#include <fstream>
#include <memory>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "core/tools/marginal_distributions.hpp"

namespace heredity {

/**
 ReportWriter renders normalised gene and trait distributions, one block per person:
 
 Harry:
   Gene:
     2: 0.0092
     ...
   Trait:
     True: 0.2665
     False: 0.7335
 */
class ReportWriter
{
public:
    using Path = boost::filesystem::path;
    
    static constexpr unsigned defaultPrecision {4};
    
    ReportWriter() = delete;
    
    // Writes to the given stream, which must outlive the writer
    ReportWriter(std::ostream& out, unsigned precision = defaultPrecision);
    // Throws UnwritableFileError if the file cannot be opened
    ReportWriter(Path file, unsigned precision = defaultPrecision);
    
    ReportWriter(const ReportWriter&)            = delete;
    ReportWriter& operator=(const ReportWriter&) = delete;
    ReportWriter(ReportWriter&&)                 = default;
    ReportWriter& operator=(ReportWriter&&)      = default;
    
    ~ReportWriter() = default;
    
    const boost::optional<Path>& path() const noexcept;
    unsigned precision() const noexcept;
    
    void write(const MarginalDistributions& distributions);
    
private:
    boost::optional<Path> path_;
    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_;
    unsigned precision_;
    
    void write(const PersonName& person, const MarginalDistributions& distributions);
};

} // namespace heredity

#endif
