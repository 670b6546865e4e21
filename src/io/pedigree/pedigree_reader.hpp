// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef pedigree_reader_hpp
#define pedigree_reader_hpp

#include <istream>

#include <boost/filesystem/path.hpp>

#include "basics/pedigree.hpp"

namespace heredity { namespace io {

// Reads a pedigree from a CSV file with a header naming the columns name, mother, father and trait.
// Throws MissingFileError if the file does not exist and MalformedFileError if it is not a valid pedigree.
Pedigree read_pedigree(const boost::filesystem::path& csv_file);

// file is only used for error reporting
Pedigree read_pedigree(std::istream& csv, const boost::filesystem::path& file);

} // namespace io
} // namespace heredity

#endif
