// Copyright 2015 Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "utils/fs/operations.hpp"

extern "C" {
#include <sys/param.h>
#include <sys/stat.h>

#include <glob.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <string>

#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;

using utils::none;
using utils::optional;


namespace {


/// Stats a file, following symbolic links.
///
/// \param path The file to stat.
///
/// \return The stat structure on success; none if the file does not exist.
///
/// \throw fs::system_error If the file exists but cannot be queried.
static optional< struct ::stat >
safe_stat(const fs::path& path)
{
    struct ::stat sb;
    if (::stat(path.c_str(), &sb) == -1) {
        const int original_errno = errno;
        if (original_errno == ENOENT || original_errno == ENOTDIR)
            return none;
        throw fs::system_error(F("Cannot get information about %s") % path,
                               original_errno);
    }
    return utils::make_optional(sb);
}


}  // anonymous namespace


/// Queries the path to the current directory.
///
/// \return The path to the current directory.
///
/// \throw fs::error If there is a problem querying the current directory.
fs::path
fs::current_path(void)
{
    char buffer[MAXPATHLEN];
    if (::getcwd(buffer, sizeof(buffer)) == NULL) {
        const int original_errno = errno;
        throw fs::system_error(F("Failed to get current working directory"),
                               original_errno);
    }
    return fs::path(buffer);
}


/// Checks if a file exists.
///
/// Be aware that this is racy in the same way as access(2) is.
///
/// \param path The file to check the existance of.
///
/// \return True if the file exists; false otherwise.
bool
fs::exists(const fs::path& path)
{
    return ::access(path.c_str(), F_OK) == 0;
}


/// Checks if a path refers to an existing directory.
///
/// \param path The path to check.
///
/// \return True if the path exists and is a directory.
///
/// \throw fs::system_error If the path cannot be queried.
bool
fs::is_directory(const fs::path& path)
{
    const optional< struct ::stat > sb = safe_stat(path);
    return sb && S_ISDIR(sb.get().st_mode);
}


/// Checks if a path refers to an existing regular file.
///
/// \param path The path to check.
///
/// \return True if the path exists and is a regular file; false for
/// directories, FIFOs, sockets and device nodes.
///
/// \throw fs::system_error If the path cannot be queried.
bool
fs::is_regular_file(const fs::path& path)
{
    const optional< struct ::stat > sb = safe_stat(path);
    return sb && S_ISREG(sb.get().st_mode);
}


/// Locates an executable in the PATH.
///
/// \param name The file to locate.
///
/// \return The path to the first executable file with the given name in the
/// PATH, or none if there is no such executable.
optional< fs::path >
fs::find_in_path(const char* name)
{
    const optional< std::string > current_path = utils::getenv("PATH");
    if (!current_path || current_path.get().empty())
        return none;

    std::istringstream path_input(current_path.get() + ":");
    std::string path_component;
    while (std::getline(path_input, path_component, ':').good()) {
        const fs::path candidate = path_component.empty() ?
            fs::path(name) : (fs::path(path_component) / name);
        if (::access(candidate.c_str(), X_OK) == 0 &&
            !fs::is_directory(candidate))
            return utils::make_optional(candidate);
    }
    return none;
}


/// Queries the size of a file.
///
/// \param path The file to query.
///
/// \return The size of the file in bytes.
///
/// \throw fs::system_error If the file does not exist or cannot be queried.
uint64_t
fs::file_size(const fs::path& path)
{
    const optional< struct ::stat > sb = safe_stat(path);
    if (!sb)
        throw fs::system_error(F("Cannot get size of %s") % path, ENOENT);
    return static_cast< uint64_t >(sb.get().st_size);
}


/// Expands a shell-style pattern into the list of matching files.
///
/// \param pattern The pattern to expand, as understood by glob(3).
///
/// \return The sorted collection of matching paths; empty if nothing
/// matched.
///
/// \throw fs::error If the expansion fails for reasons other than not finding
///     any match.
std::vector< fs::path >
fs::glob(const std::string& pattern)
{
    ::glob_t matches;
    const int ret = ::glob(pattern.c_str(), 0, NULL, &matches);
    if (ret == GLOB_NOMATCH) {
        ::globfree(&matches);
        return std::vector< fs::path >();
    } else if (ret != 0) {
        ::globfree(&matches);
        throw fs::error(F("Failed to expand pattern '%s'") % pattern);
    }

    std::vector< fs::path > paths;
    try {
        for (std::size_t i = 0; i < matches.gl_pathc; ++i)
            paths.push_back(fs::path(matches.gl_pathv[i]));
    } catch (...) {
        ::globfree(&matches);
        throw;
    }
    ::globfree(&matches);
    return paths;
}


/// Makes a directory.
///
/// \param dir The path to the directory to create.
/// \param mode The permissions for the new directory.
///
/// \throw system_error If the call to mkdir(2) fails.
void
fs::mkdir(const fs::path& dir, const int mode)
{
    if (::mkdir(dir.c_str(), static_cast< mode_t >(mode)) == -1) {
        const int original_errno = errno;
        throw fs::system_error(F("Failed to create directory %s") % dir,
                               original_errno);
    }
}


/// Creates a temporary file that is not deleted automatically.
///
/// \param path_template The template for the name of the file; must end in
///     XXXXXX as required by mkstemp(3).
///
/// \return The path to the new, empty file.
///
/// \throw system_error If the call to mkstemp(3) fails.
fs::path
fs::mkstemp_keep(const std::string& path_template)
{
    std::vector< char > buffer(path_template.begin(), path_template.end());
    buffer.push_back('\0');
    const int fd = ::mkstemp(&buffer[0]);
    if (fd == -1) {
        const int original_errno = errno;
        throw fs::system_error(F("Failed to create temporary file with "
                                 "template %s") % path_template,
                               original_errno);
    }
    ::close(fd);
    return fs::path(&buffer[0]);
}


/// Makes a directory and any missing parents.
///
/// This is separate from the fs::mkdir function to clearly differentiate the
/// libc wrapper from the more complex algorithm implemented here.
///
/// \param dir The path to the directory to create.
/// \param mode The permissions for the new directories.
///
/// \throw system_error If any call to mkdir(2) fails.
void
fs::mkdir_p(const fs::path& dir, const int mode)
{
    try {
        fs::mkdir(dir, mode);
    } catch (const fs::system_error& e) {
        if (e.original_errno() == ENOENT) {
            fs::mkdir_p(dir.branch_path(), mode);
            fs::mkdir(dir, mode);
        } else if (e.original_errno() != EEXIST)
            throw e;
    }
}


/// Removes an empty directory.
///
/// \param dir The directory to remove.
///
/// \throw fs::system_error If the call to rmdir(2) fails.
void
fs::rmdir(const path& dir)
{
    if (::rmdir(dir.c_str()) == -1) {
        const int original_errno = errno;
        throw fs::system_error(F("Removal of %s failed") % dir,
                               original_errno);
    }
}


/// Removes a file.
///
/// \param file The file to remove.
///
/// \throw fs::system_error If the call to unlink(2) fails.
void
fs::unlink(const path& file)
{
    if (::unlink(file.c_str()) == -1) {
        const int original_errno = errno;
        throw fs::system_error(F("Removal of %s failed") % file,
                               original_errno);
    }
}
