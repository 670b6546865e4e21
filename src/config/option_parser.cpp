// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_parser.hpp"

#include <vector>
#include <iostream>
#include <stdexcept>
#include <sstream>
#include <fstream>
#include <algorithm>
#include <iterator>
#include <utility>
#include <memory>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/any.hpp>

#include "utils/path_utils.hpp"
#include "utils/string_utils.hpp"
#include "utils/maths.hpp"
#include "exceptions/user_error.hpp"
#include "config.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace heredity { namespace options {

namespace {

fs::path resolve_path(const fs::path& path, const OptionMap& options);
void parse_config_file(const fs::path& config_file, OptionMap& vm, const po::options_description& options);
void validate(const OptionMap& vm);
void notify_options(OptionMap& vm);
void run(po::command_line_parser& parser, OptionMap& vm);

} // namespace

OptionMap parse_options(const int argc, const char** argv)
{
    po::options_description general("General");
    general.add_options()
    ("help,h",
     "Report detailed option information")
    
    ("version",
     "Report detailed version information")
    
    ("config",
     po::value<fs::path>(),
     "Config file to populate command line options")
    
    ("debug",
     po::value<fs::path>()->implicit_value("heredity_debug.log"),
     "Create log file for debugging")
    
    ("trace",
     po::value<fs::path>()->implicit_value("heredity_trace.log"),
     "Create very verbose log file for debugging")
    
    ("working-directory,w",
     po::value<fs::path>(),
     "Sets the working directory")
    
    ("data,d",
     po::value<fs::path>()->required(),
     "CSV file with columns name, mother, father and trait describing the family to be analysed")
    
    ("output,o",
     po::value<fs::path>(),
     "File to where the gene and trait distributions are written. If unspecified, output is written to stdout")
    
    ("precision",
     po::value<int>()->default_value(4),
     "Number of decimal places used to report probabilities")
    ;
    
    po::options_description model("Model");
    model.add_options()
    ("gene-prior",
     po::value<std::vector<double>>()->multitoken(),
     "Probabilities that a person with no parents has zero, one and two copies of the gene (default 0.96 0.03 0.01)")
    
    ("mutation-rate",
     po::value<double>()->default_value(0.01),
     "Probability that a copy of the gene passed from a parent to a child mutates into or out of the gene")
    
    ("trait-given-zero-copies",
     po::value<double>()->default_value(0.01),
     "Probability that a person with zero copies of the gene has the trait")
    
    ("trait-given-one-copy",
     po::value<double>()->default_value(0.56),
     "Probability that a person with one copy of the gene has the trait")
    
    ("trait-given-two-copies",
     po::value<double>()->default_value(0.65),
     "Probability that a person with two copies of the gene has the trait")
    ;
    
    po::positional_options_description positional {};
    positional.add("data", 1);
    
    po::options_description all("heredity command line options");
    all.add(general).add(model);
    
    OptionMap vm_init;
    po::command_line_parser init_parser {argc, argv};
    init_parser.options(all).positional(positional).allow_unregistered();
    run(init_parser, vm_init);
    
    if (vm_init.count("help") == 1) {
        std::cout << "Usage: heredity [options] data.csv\n\n" << all << std::endl;
        return vm_init;
    }
    
    if (vm_init.count("version") == 1) {
        std::cout << "heredity version " << config::Version << '\n'
                  << "Boost: " << config::BoostVersion
                  << std::endl;
        return vm_init;
    }
    
    OptionMap vm;
    
    if (vm_init.count("config") == 1) {
        auto config_path = resolve_path(vm_init.at("config").as<fs::path>(), vm_init);
        parse_config_file(config_path, vm, all);
    }
    
    vm_init.clear();
    po::command_line_parser parser {argc, argv};
    parser.options(all).positional(positional);
    run(parser, vm);
    validate(vm);
    notify_options(vm);
    
    return vm;
}

namespace {

fs::path resolve_path(const fs::path& path, const OptionMap& options)
{
    boost::optional<fs::path> working_directory {};
    if (options.count("working-directory") == 1) {
        working_directory = options.at("working-directory").as<fs::path>();
    }
    return ::heredity::resolve_path(path, get_working_directory(working_directory));
}

class CommandLineError : public UserError
{
public:
    CommandLineError() = default;
    
    CommandLineError(std::string&& why) : why_ {std::move(why)} {}
    
protected:
    std::string why_;

private:
    virtual std::string do_where() const override
    {
        return "parse_options";
    }
    
    virtual std::string do_why() const override
    {
        return why_;
    }
    
    virtual std::string do_help() const override
    {
        return "use the --help command to view required and allowable options";
    }
};

class BadConfigFile : public  CommandLineError
{
public:
    BadConfigFile(fs::path p)
    {
        std::ostringstream ss {};
        ss << "The config file path (" << p << ") given in the option '--config' does not exist";
        why_ = ss.str();
    }
};

class UnknownCommandLineOption : public CommandLineError
{
public:
    UnknownCommandLineOption(std::string option)
    : CommandLineError { "The option you specified '--" + option + "' is not recognised"}
    {}
};

class MissingRequiredCommandLineArguement : public CommandLineError
{
public:
    MissingRequiredCommandLineArguement(std::string option)
    : CommandLineError {"The command line option '--" + option + "' is required but is missing"}
    {}
};

class InvalidCommandLineOptionValue : public CommandLineError
{
public:
    template <typename T>
    InvalidCommandLineOptionValue(std::string option, T value, std::string reason)
    : CommandLineError {
    "The arguement '" + std::to_string(value) + "' given to option '--" + option
    + "' was rejected as it " + reason
    } {}
};

class WrongNumberOfCommandLineValues : public CommandLineError
{
public:
    WrongNumberOfCommandLineValues(std::string option, std::size_t expected, std::size_t given)
    {
        std::ostringstream ss {};
        ss << "The option '--" << option << "' requires " << expected << " values but " << given << " were given";
        why_ = ss.str();
    }
};

CommandLineError make_command_line_error(const po::error& e)
{
    if (const auto unknown = dynamic_cast<const po::unknown_option*>(std::addressof(e))) {
        return UnknownCommandLineOption {po::strip_prefixes(unknown->get_option_name())};
    }
    if (const auto required = dynamic_cast<const po::required_option*>(std::addressof(e))) {
        return MissingRequiredCommandLineArguement {po::strip_prefixes(required->get_option_name())};
    }
    return CommandLineError {e.what()};
}

void parse_config_file(const fs::path& config_file, OptionMap& vm, const po::options_description& options)
{
    if (!fs::exists(config_file)) {
        throw BadConfigFile {config_file};
    }
    std::ifstream config {config_file.string()};
    if (!config) {
        throw BadConfigFile {config_file};
    }
    try {
        po::store(po::parse_config_file(config, options), vm);
    } catch (const po::error& e) {
        throw make_command_line_error(e);
    }
}

void check_strictly_positive(const std::string& option, const OptionMap& vm)
{
    if (vm.count(option) == 1) {
        const auto value = vm.at(option).as<int>();
        if (value < 1) {
            throw InvalidCommandLineOptionValue {option, value, "must be greater than zero" };
        }
    }
}

void check_probability(const std::string& option, const OptionMap& vm)
{
    if (vm.count(option) == 1) {
        const auto value = vm.at(option).as<double>();
        if (!maths::is_probability(value)) {
            throw InvalidCommandLineOptionValue {option, value, "must be between zero and one" };
        }
    }
}

void check_probabilities(const std::string& option, const std::size_t num_values, const OptionMap& vm)
{
    if (vm.count(option) == 1) {
        const auto& values = vm.at(option).as<std::vector<double>>();
        if (values.size() != num_values) {
            throw WrongNumberOfCommandLineValues {option, num_values, values.size()};
        }
        for (const auto value : values) {
            if (!maths::is_probability(value)) {
                throw InvalidCommandLineOptionValue {option, value, "must be between zero and one" };
            }
        }
    }
}

// values are converted by store, not by the parser
void run(po::command_line_parser& parser, OptionMap& vm)
{
    try {
        po::store(parser.run(), vm);
    } catch (const po::error& e) {
        throw make_command_line_error(e);
    }
}

// required options are only checked by notify
void notify_options(OptionMap& vm)
{
    try {
        po::notify(vm);
    } catch (const po::error& e) {
        throw make_command_line_error(e);
    }
}

void validate(const OptionMap& vm)
{
    const std::vector<std::string> strictly_positive_int_options {
        "precision"
    };
    const std::vector<std::string> probability_options {
        "mutation-rate", "trait-given-zero-copies", "trait-given-one-copy", "trait-given-two-copies"
    };
    for (const auto& option : strictly_positive_int_options) {
        check_strictly_positive(option, vm);
    }
    for (const auto& option : probability_options) {
        check_probability(option, vm);
    }
    check_probabilities("gene-prior", 3, vm);
}

template <typename T>
const T* get_if(const po::variable_value& value)
{
    return boost::any_cast<T>(std::addressof(value.value()));
}

void write_value(const po::variable_value& value, std::ostream& os)
{
    if (value.empty()) {
        os << "(empty)";
    } else if (const auto path = get_if<fs::path>(value)) {
        os << path->filename().string();
    } else if (const auto integer = get_if<int>(value)) {
        os << *integer;
    } else if (const auto real = get_if<double>(value)) {
        os << *real;
    } else if (const auto reals = get_if<std::vector<double>>(value)) {
        std::transform(std::cbegin(*reals), std::cend(*reals), std::ostream_iterator<std::string> {os, " "},
                       [] (const double x) { std::ostringstream ss {}; ss << x; return ss.str(); });
    } else {
        os << "UnknownType(" << value.value().type().name() << ")";
    }
}

} // namespace

std::ostream& operator<<(std::ostream& os, const OptionMap& options)
{
    std::size_t i {0};
    for (const auto& p : options) {
        // '>' marks values the user did not set
        os << (p.second.defaulted() ? '>' : '~') << ' ' << p.first << '=';
        write_value(p.second, os);
        if (++i != options.size()) os << '\n';
    }
    return os;
}

std::string to_string(const OptionMap& options, const bool one_line, const bool mark_modified)
{
    std::ostringstream ss {};
    ss << options;
    if (!one_line) return ss.str();
    auto lines = utils::split(ss.str(), '\n');
    for (auto& line : lines) {
        if (line.size() < 2) continue;
        const bool modified {line.front() == '~'};
        line.replace(0, 2, modified && mark_modified ? "*--" : "--");
        std::replace(std::begin(line), std::end(line), '=', ' ');
        utils::trim(line);
    }
    return utils::join(lines, ' ');
}

} // namespace options
} // namespace heredity
