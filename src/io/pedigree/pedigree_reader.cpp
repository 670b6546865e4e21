// Copyright (c) 2016 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "pedigree_reader.hpp"

#include <vector>
#include <string>
#include <iterator>
#include <algorithm>
#include <fstream>
#include <cstddef>
#include <utility>
#include <initializer_list>

#include <boost/optional.hpp>
#include <boost/filesystem/operations.hpp>

#include "exceptions/missing_file_error.hpp"
#include "exceptions/malformed_file_error.hpp"
#include "utils/string_utils.hpp"

namespace heredity { namespace io {

class MissingPedigreeFile : public MissingFileError
{
    std::string do_where() const override { return "read_pedigree"; }
public:
    MissingPedigreeFile(boost::filesystem::path p) : MissingFileError {std::move(p), std::string {"pedigree"}} {}
};

class MalformedPedigreeCSV : public MalformedFileError
{
    std::string do_where() const override { return "read_pedigree"; }
    std::string do_help() const override
    {
        return "the pedigree must be a CSV file with columns name, mother, father and trait, "
               "where mother and father are both empty or both name people in the file";
    }
public:
    MalformedPedigreeCSV(boost::filesystem::path file, std::string reason, boost::optional<std::size_t> line = boost::none)
    : MalformedFileError {std::move(file), "pedigree CSV"}
    {
        set_reason(std::move(reason));
        if (line) set_line_number(*line);
    }
};

namespace {

struct Line
{
    std::string line_data;
    operator std::string() const { return line_data; }
};

std::istream& operator>>(std::istream& is, Line& data)
{
    std::getline(is, data.line_data);
    if (!data.line_data.empty() && data.line_data.back() == '\r') {
        data.line_data.pop_back();
    }
    return is;
}

struct CSVRecord
{
    std::string name, mother, father;
    boost::optional<bool> trait;
    std::size_t line;
};

struct Header
{
    std::size_t num_fields, name, mother, father, trait;
};

bool is_blank(const std::string& line)
{
    return std::all_of(std::cbegin(line), std::cend(line), [] (const char c) { return c == ' ' || c == '\t'; });
}

// Fields may be double quoted, in which case they can hold commas and "" stands for one quote.
// Unquoted fields are trimmed; quoted fields are kept as written.
std::vector<std::string> split_fields(const std::string& line, const std::size_t line_number,
                                      const boost::filesystem::path& file)
{
    std::vector<std::string> result {};
    std::string field {};
    bool quoted {false}, in_quotes {false};
    const auto finish_field = [&] () {
        if (!quoted) utils::trim(field);
        result.push_back(std::move(field));
        field.clear();
        quoted = false;
    };
    for (std::size_t i {0}; i < line.size(); ++i) {
        const char c {line[i]};
        if (in_quotes) {
            if (c != '"') {
                field += c;
            } else if (i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else {
                in_quotes = false;
            }
        } else if (c == ',') {
            finish_field();
        } else if (c == '"' && !quoted && is_blank(field)) {
            field.clear();
            quoted = in_quotes = true;
        } else if (quoted) {
            if (c != ' ' && c != '\t') {
                throw MalformedPedigreeCSV {file, "unexpected text after a closing quote", line_number};
            }
        } else {
            field += c;
        }
    }
    if (in_quotes) {
        throw MalformedPedigreeCSV {file, "a quoted field is not closed", line_number};
    }
    finish_field();
    return result;
}

std::size_t find_column(const std::vector<std::string>& fields, const std::string& column,
                        const std::size_t line_number, const boost::filesystem::path& file)
{
    const auto itr = std::find(std::cbegin(fields), std::cend(fields), column);
    if (itr == std::cend(fields)) {
        throw MalformedPedigreeCSV {file, "the header has no '" + column + "' column", line_number};
    }
    return std::distance(std::cbegin(fields), itr);
}

Header parse_header(const std::string& line, const std::size_t line_number, const boost::filesystem::path& file)
{
    auto fields = split_fields(line, line_number, file);
    for (auto& field : fields) utils::to_lower(field);
    return {fields.size(),
            find_column(fields, "name", line_number, file),
            find_column(fields, "mother", line_number, file),
            find_column(fields, "father", line_number, file),
            find_column(fields, "trait", line_number, file)};
}

boost::optional<bool> parse_trait(const std::string& field, const std::size_t line, const boost::filesystem::path& file)
{
    if (field.empty()) {
        return boost::none;
    } else if (field == "1") {
        return true;
    } else if (field == "0") {
        return false;
    }
    throw MalformedPedigreeCSV {file, "trait must be 1, 0 or empty but found '" + field + "'", line};
}

CSVRecord parse_record(const std::string& line, const std::size_t line_number, const Header& header,
                       const boost::filesystem::path& file)
{
    auto fields = split_fields(line, line_number, file);
    if (fields.size() > header.num_fields) {
        throw MalformedPedigreeCSV {file, "expected at most " + std::to_string(header.num_fields) + " fields but found "
                                          + std::to_string(fields.size()), line_number};
    }
    // missing trailing fields are blank
    fields.resize(header.num_fields);
    CSVRecord result {fields[header.name], fields[header.mother], fields[header.father],
                      parse_trait(fields[header.trait], line_number, file), line_number};
    if (result.name.empty()) {
        throw MalformedPedigreeCSV {file, "a person has no name", line_number};
    }
    if (result.mother.empty() != result.father.empty()) {
        throw MalformedPedigreeCSV {file, result.name + " must have both parents or neither", line_number};
    }
    return result;
}

bool has_parents(const CSVRecord& record) noexcept
{
    return !record.mother.empty();
}

} // namespace

Pedigree read_pedigree(std::istream& csv, const boost::filesystem::path& file)
{
    std::vector<CSVRecord> records {};
    boost::optional<Header> header {};
    std::size_t line_number {0};
    std::for_each(std::istream_iterator<Line> {csv}, std::istream_iterator<Line> {},
                  [&] (const Line& line) {
                      ++line_number;
                      if (is_blank(line.line_data)) return;
                      if (header) {
                          records.push_back(parse_record(line.line_data, line_number, *header, file));
                      } else {
                          header = parse_header(line.line_data, line_number, file);
                      }
                  });
    if (!header) {
        throw MalformedPedigreeCSV {file, "the file is empty"};
    }
    Pedigree result {records.size()};
    for (const auto& record : records) {
        if (result.is_member(record.name)) {
            throw MalformedPedigreeCSV {file, record.name + " appears more than once", record.line};
        }
        result.add_member({record.name, record.trait});
    }
    for (const auto& record : records) {
        if (!has_parents(record)) continue;
        for (const auto& parent : {record.mother, record.father}) {
            if (!result.is_member(parent)) {
                throw MalformedPedigreeCSV {file, "parent " + parent + " of " + record.name + " is not in the file", record.line};
            }
        }
        if (record.mother == record.father) {
            throw MalformedPedigreeCSV {file, record.name + " has the same mother and father", record.line};
        }
        result.set_parents(record.name, record.mother, record.father);
    }
    if (!result.is_acyclic()) {
        throw MalformedPedigreeCSV {file, "somebody is their own ancestor"};
    }
    return result;
}

Pedigree read_pedigree(const boost::filesystem::path& csv_file)
{
    if (!boost::filesystem::exists(csv_file)) {
        throw MissingPedigreeFile {csv_file};
    }
    std::ifstream csv {csv_file.string()};
    if (!csv) {
        throw MalformedPedigreeCSV {csv_file, "the file could not be read"};
    }
    return read_pedigree(csv, csv_file);
}

} // namespace io
} // namespace heredity
