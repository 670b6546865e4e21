// Copyright (c) 2015-2020 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "path_utils.hpp"

#include <string>
#include <sstream>
#include <cstdlib>
#include <fstream>
#include <utility>

#include <boost/filesystem/operations.hpp>

#include "exceptions/system_error.hpp"
#include "exceptions/user_error.hpp"

namespace heredity {

boost::optional<fs::path> get_home_directory()
{
    const auto env = std::getenv("HOME");
    if (env == nullptr) return boost::none;
    const fs::path home {env};
    if (fs::is_directory(home)) return home;
    return boost::none;
}

bool is_shorthand_user_path(const fs::path& path) noexcept
{
    return !path.empty() && path.string().front() == '~';
}

namespace {

class UnknownHomeDirectory : public SystemError
{
    std::string do_where() const override
    {
        return "expand_user_path";
    }
    
    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "Unable to expand shorthand path you specified ";
        ss << path_;
        ss << " as your home directory cannot be located";
        return ss.str();
    }
    
    std::string do_help() const override
    {
        return "ensure your HOME environment variable is set properly";
    }
    
    fs::path path_;
    
public:
    UnknownHomeDirectory(fs::path p) : path_ {std::move(p)} {}
};

class InvalidWorkingDirectory : public UserError
{
    std::string do_where() const override { return "get_working_directory"; }
    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "the working directory you specified " << path_ << " is not a directory";
        return ss.str();
    }
    std::string do_help() const override { return "enter an existing directory"; }
    
    fs::path path_;
public:
    InvalidWorkingDirectory(fs::path p) : path_ {std::move(p)} {}
};

} // namespace

fs::path expand_user_path(const fs::path& path)
{
    if (is_shorthand_user_path(path)) {
        if (path.string().size() > 1 && path.string()[1] == '/') {
            const auto home_dir = get_home_directory();
            if (home_dir) {
                return fs::path {home_dir->string() + path.string().substr(1)};
            }
            throw UnknownHomeDirectory {path};
        }
    }
    return path;
}

fs::path get_working_directory(const boost::optional<fs::path>& requested)
{
    if (!requested) return fs::current_path();
    auto result = expand_user_path(*requested);
    if (!fs::is_directory(result)) {
        throw InvalidWorkingDirectory {std::move(result)};
    }
    return result;
}

fs::path resolve_path(const fs::path& path, const fs::path& working_directory)
{
    if (is_shorthand_user_path(path)) {
        return fs::absolute(expand_user_path(path));
    }
    if (path.is_absolute()) {
        return path;
    }
    return fs::absolute(working_directory / path);
}

bool is_writable_location(const fs::path& path)
{
    const auto parent = path.has_parent_path() ? path.parent_path() : fs::current_path();
    if (!fs::is_directory(parent)) return false;
    const bool existed {fs::exists(path)};
    bool result;
    {
        std::ofstream test_file {path.string(), std::ios_base::app};
        result = test_file.is_open();
    }
    if (result && !existed) {
        boost::system::error_code ec {};
        fs::remove(path, ec);
    }
    return result;
}

} // namespace heredity
