// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>
#include <sstream>
#include <fstream>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>

#include "basics/pedigree.hpp"
#include "io/pedigree/pedigree_reader.hpp"
#include "exceptions/missing_file_error.hpp"
#include "exceptions/malformed_file_error.hpp"

namespace heredity { namespace test {

namespace fs = boost::filesystem;

namespace {

const fs::path test_csv {"test.csv"};

Pedigree read(const std::string& csv)
{
    std::istringstream ss {csv};
    return io::read_pedigree(ss, test_csv);
}

struct TemporaryFile
{
    TemporaryFile(const std::string& contents)
    : path {fs::temp_directory_path() / fs::unique_path("heredity-%%%%-%%%%-%%%%.csv")}
    {
        std::ofstream file {path.string()};
        file << contents;
    }
    
    ~TemporaryFile()
    {
        boost::system::error_code ec {};
        fs::remove(path, ec);
    }
    
    fs::path path;
};

} // namespace

BOOST_AUTO_TEST_SUITE(io)
BOOST_AUTO_TEST_SUITE(pedigree_reader)

BOOST_AUTO_TEST_CASE(read_pedigree_reads_people_parents_and_traits)
{
    const auto pedigree = read("name,mother,father,trait\n"
                               "Harry,Lily,James,\n"
                               "James,,,1\n"
                               "Lily,,,0\n");
    const std::vector<PersonName> expected {"Harry", "James", "Lily"};
    const auto members = pedigree.members();
    BOOST_CHECK_EQUAL_COLLECTIONS(std::cbegin(members), std::cend(members), std::cbegin(expected), std::cend(expected));
    const auto parents = pedigree.parents_of("Harry");
    BOOST_REQUIRE(parents);
    BOOST_CHECK_EQUAL(parents->mother, "Lily");
    BOOST_CHECK_EQUAL(parents->father, "James");
    BOOST_CHECK(!pedigree.has_parents("James"));
    BOOST_CHECK(!pedigree.observed_trait("Harry"));
    BOOST_CHECK(pedigree.observed_trait("James") && *pedigree.observed_trait("James"));
    BOOST_CHECK(pedigree.observed_trait("Lily") && !*pedigree.observed_trait("Lily"));
}

BOOST_AUTO_TEST_CASE(columns_are_identified_by_the_header)
{
    const auto pedigree = read("trait,father,name,mother\n"
                               "1,,James,\n"
                               ",James,Harry,Lily\n"
                               "0,,Lily,\n");
    BOOST_CHECK_EQUAL(*pedigree.mother_of("Harry"), "Lily");
    BOOST_CHECK_EQUAL(*pedigree.father_of("Harry"), "James");
    BOOST_CHECK(*pedigree.observed_trait("James"));
    BOOST_CHECK(!pedigree.observed_trait("Harry"));
}

BOOST_AUTO_TEST_CASE(whitespace_blank_lines_and_carriage_returns_are_ignored)
{
    const auto pedigree = read("name, mother, father, trait\r\n"
                               "\r\n"
                               "Harry , Lily , James ,\r\n"
                               "James,,, 1\r\n"
                               "Lily,,,0");
    BOOST_CHECK_EQUAL(pedigree.size(), 3);
    BOOST_CHECK(pedigree.has_parents("Harry"));
    BOOST_CHECK(!*pedigree.observed_trait("Lily"));
}

BOOST_AUTO_TEST_CASE(quoted_fields_may_contain_commas_and_quotes)
{
    const auto pedigree = read("name,mother,father,trait\n"
                               "\"Potter, Harry\",\"Lily\",James,1\n"
                               "\"Lily\",,,\"0\"\n"
                               "James,,,\n"
                               "\"Ronald \"\"Ron\"\" Weasley\",,,\n");
    const std::vector<PersonName> expected {"Potter, Harry", "Lily", "James", "Ronald \"Ron\" Weasley"};
    const auto members = pedigree.members();
    BOOST_CHECK_EQUAL_COLLECTIONS(std::cbegin(members), std::cend(members), std::cbegin(expected), std::cend(expected));
    BOOST_CHECK_EQUAL(*pedigree.mother_of("Potter, Harry"), "Lily");
    BOOST_CHECK_EQUAL(*pedigree.father_of("Potter, Harry"), "James");
    BOOST_CHECK(*pedigree.observed_trait("Potter, Harry"));
    BOOST_CHECK(!*pedigree.observed_trait("Lily"));
}

BOOST_AUTO_TEST_CASE(quoted_fields_keep_their_whitespace)
{
    const auto pedigree = read("name,mother,father,trait\n"
                               " \" Harry \" ,,,\n");
    BOOST_CHECK(pedigree.is_member(" Harry "));
}

BOOST_AUTO_TEST_CASE(missing_trailing_fields_are_blank)
{
    const auto pedigree = read("name,mother,father,trait\n"
                               "Harry,,\n"
                               "Lily\n"
                               "James,,,1\n");
    BOOST_CHECK_EQUAL(pedigree.size(), 3);
    BOOST_CHECK(!pedigree.has_parents("Harry"));
    BOOST_CHECK(!pedigree.observed_trait("Harry"));
    BOOST_CHECK(!pedigree.observed_trait("Lily"));
    BOOST_CHECK(*pedigree.observed_trait("James"));
}

BOOST_AUTO_TEST_CASE(files_with_only_a_header_are_empty_pedigrees)
{
    BOOST_CHECK(read("name,mother,father,trait\n").is_empty());
}

BOOST_AUTO_TEST_CASE(malformed_pedigrees_are_rejected)
{
    // empty
    BOOST_CHECK_THROW(read(""), MalformedFileError);
    // missing column
    BOOST_CHECK_THROW(read("name,mother,father\nHarry,,\n"), MalformedFileError);
    // more fields than the header
    BOOST_CHECK_THROW(read("name,mother,father,trait\nHarry,,,1,x\n"), MalformedFileError);
    // unclosed quote
    BOOST_CHECK_THROW(read("name,mother,father,trait\n\"Harry,,,1\n"), MalformedFileError);
    // text after a closing quote
    BOOST_CHECK_THROW(read("name,mother,father,trait\n\"Harry\"x,,,1\n"), MalformedFileError);
    // invalid trait
    BOOST_CHECK_THROW(read("name,mother,father,trait\nHarry,,,yes\n"), MalformedFileError);
    // single parent
    BOOST_CHECK_THROW(read("name,mother,father,trait\nHarry,Lily,,\nLily,,,\n"), MalformedFileError);
    // duplicate name
    BOOST_CHECK_THROW(read("name,mother,father,trait\nHarry,,,\nHarry,,,1\n"), MalformedFileError);
    // dangling parent
    BOOST_CHECK_THROW(read("name,mother,father,trait\nHarry,Lily,James,\nJames,,,\n"), MalformedFileError);
    // same mother and father
    BOOST_CHECK_THROW(read("name,mother,father,trait\nHarry,Lily,Lily,\nLily,,,\n"), MalformedFileError);
    // unnamed person
    BOOST_CHECK_THROW(read("name,mother,father,trait\n,,,\n"), MalformedFileError);
    // cyclic
    BOOST_CHECK_THROW(read("name,mother,father,trait\nA,B,C,\nB,A,C,\nC,,,\n"), MalformedFileError);
}

BOOST_AUTO_TEST_CASE(malformed_file_errors_report_the_line)
{
    try {
        read("name,mother,father,trait\nJames,,,1\nHarry,,,maybe\n");
        BOOST_FAIL("expected MalformedFileError");
    } catch (const MalformedFileError& e) {
        BOOST_CHECK_EQUAL(e.file(), test_csv);
        BOOST_REQUIRE(e.reason());
        BOOST_CHECK(e.reason()->find("maybe") != std::string::npos);
        BOOST_CHECK(std::string {e.what()}.find("line 3") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(read_pedigree_reads_files)
{
    const TemporaryFile csv {"name,mother,father,trait\nHarry,Lily,James,\nJames,,,1\nLily,,,0\n"};
    const auto pedigree = heredity::io::read_pedigree(csv.path);
    BOOST_CHECK_EQUAL(pedigree.size(), 3);
    BOOST_CHECK(pedigree.has_parents("Harry"));
}

BOOST_AUTO_TEST_CASE(read_pedigree_throws_if_the_file_does_not_exist)
{
    const auto path = fs::temp_directory_path() / fs::unique_path("heredity-missing-%%%%-%%%%.csv");
    BOOST_CHECK_THROW(heredity::io::read_pedigree(path), MissingFileError);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
