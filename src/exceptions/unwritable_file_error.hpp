// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef unwritable_file_error_hpp
#define unwritable_file_error_hpp

#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "user_error.hpp"

namespace heredity {

class UnwritableFileError : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    UnwritableFileError() = delete;
    
    UnwritableFileError(Path file, boost::optional<std::string> description = boost::none);
    
    virtual ~UnwritableFileError() override = default;
    
    void set_reason(std::string reason) noexcept;
    
    const Path& file() const noexcept;
    
private:
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    Path file_;
    boost::optional<std::string> description_, reason_;
};

} // namespace heredity

#endif
