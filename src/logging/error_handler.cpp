// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "error_handler.hpp"

#include <string>
#include <vector>
#include <cstddef>
#include <cctype>
#include <utility>

#include "exceptions/system_error.hpp"
#include "config/config.hpp"
#include "config/common.hpp"
#include "utils/string_utils.hpp"
#include "logging.hpp"

namespace heredity {

namespace {

// Sentences are capitalised and end with a full stop
std::string as_sentence(std::string message)
{
    utils::trim(message);
    utils::capitalise_front(message);
    if (!message.empty() && message.back() != '.') message += '.';
    return message;
}

// Greedy word wrap, every line prefixed with indent
std::vector<std::string> wrap(const std::string& text, const std::string& indent, const std::size_t width)
{
    std::vector<std::string> result {};
    std::string line {};
    for (auto& word : utils::split(text, ' ')) {
        if (word.empty()) continue;
        if (!line.empty() && indent.size() + line.size() + word.size() + 1 > width) {
            result.push_back(indent + line);
            line.clear();
        }
        if (!line.empty()) line += ' ';
        line += word;
    }
    if (!line.empty()) result.push_back(indent + line);
    return result;
}

class ErrorReport
{
public:
    ErrorReport(const Error& error) : lines_ {}
    {
        add_heading(error);
        add_paragraph(error.why(), "    ");
        auto help = error.help();
        if (!help.empty()) {
            help.front() = std::tolower(help.front());
            add_paragraph("To help resolve this error " + help);
        }
        if (error.type() == "program") {
            add_paragraph("The error was raised in " + error.where());
        }
    }
    
    void write(logging::ErrorLogger& log) const
    {
        for (const auto& line : lines_) log << line;
    }
    
private:
    std::vector<std::string> lines_;
    
    void add_heading(const Error& error)
    {
        const auto type = error.type();
        lines_.push_back((type == "unclassified" ? "An " : "A ") + type + " error has occurred:");
    }
    
    void add_paragraph(const std::string& text, const std::string& indent = "")
    {
        auto paragraph = wrap(as_sentence(text), indent, config::CommandLineWidth);
        if (paragraph.empty()) return;
        lines_.emplace_back();
        lines_.insert(std::end(lines_), std::make_move_iterator(std::begin(paragraph)),
                      std::make_move_iterator(std::end(paragraph)));
    }
};

class OutOfMemory : public SystemError
{
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return "the system could not satisfy a memory request"; }
    std::string do_help() const override
    {
        return "check the size of the pedigree, the number of configurations grows as 3^n";
    }
};

class UnclassifiedError : public Error
{
    std::string do_type() const override { return "unclassified"; }
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return why_; }
    std::string do_help() const override
    {
        return "submit an error report to " + config::BugReport;
    }
    
    std::string why_;
    
public:
    UnclassifiedError(std::string why) : why_ {std::move(why)} {}
};

} // namespace

void log_error(const Error& error)
{
    logging::ErrorLogger log {};
    ErrorReport {error}.write(log);
    auto debug_log = logging::get_debug_log();
    if (debug_log) stream(*debug_log) << "Error raised in " << error.where() << ": " << error.why();
}

void log_error(const std::bad_alloc&)
{
    log_error(OutOfMemory {});
}

void log_error(const std::exception& error)
{
    log_error(UnclassifiedError {error.what()});
}

void log_unknown_error()
{
    log_error(UnclassifiedError {"an unknown exception was thrown"});
}

} // namespace heredity
