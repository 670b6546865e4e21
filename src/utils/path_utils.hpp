// Copyright (c) 2016 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef path_utils_hpp
#define path_utils_hpp

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

namespace heredity {

namespace fs = boost::filesystem;

boost::optional<fs::path> get_home_directory();

bool is_shorthand_user_path(const fs::path& path) noexcept;

fs::path expand_user_path(const fs::path& path);

// The requested directory, which must exist, or the current directory if none was requested
fs::path get_working_directory(const boost::optional<fs::path>& requested = boost::none);

// Relative paths are taken relative to the working directory, user paths are expanded.
fs::path resolve_path(const fs::path& path, const fs::path& working_directory);

// True if a file could be opened for writing at path. Does not leave behind any file it creates.
bool is_writable_location(const fs::path& path);

} // namespace heredity

#endif
