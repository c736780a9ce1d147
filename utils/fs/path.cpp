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

#include "utils/fs/path.hpp"

#include "utils/fs/exceptions.hpp"
#include "utils/fs/operations.hpp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;


namespace {


/// Collapses the redundant separators of a path.
///
/// Repeated slashes are reduced to a single one and trailing slashes are
/// removed, except for the root directory itself.
///
/// \param in The path to normalize.
///
/// \return The normalized representation of the path.
///
/// \throw fs::invalid_path_error If the path is empty.
static std::string
normalize(const std::string& in)
{
    if (in.empty())
        throw fs::invalid_path_error(in, "Cannot be empty");

    std::string out;
    out.reserve(in.length());
    for (std::string::size_type i = 0; i < in.length(); ++i) {
        if (in[i] == '/' && !out.empty() && out[out.length() - 1] == '/')
            continue;
        out += in[i];
    }
    if (out.length() > 1 && out[out.length() - 1] == '/')
        out.erase(out.length() - 1);

    INV(!out.empty());
    return out;
}


}  // anonymous namespace


/// Creates a new path object from a textual representation of a path.
///
/// \param text A valid representation of a path in textual form.
///
/// \throw fs::invalid_path_error If the input text does not represent a valid
///     path.
fs::path::path(const std::string& text) :
    _repr(normalize(text))
{
}


/// Gets a view of the path as an array of characters.
///
/// \return A pointer to the internal representation of the path.
const char*
fs::path::c_str(void) const
{
    return _repr.c_str();
}


/// Gets a view of the path as a std::string.
///
/// \return A reference to the internal representation of the path.
const std::string&
fs::path::str(void) const
{
    return _repr;
}


/// Gets the branch path (directory name) of the path.
///
/// The branch path of a path with just one component (no separators) is ".".
///
/// \return A new path representing the branch path.
fs::path
fs::path::branch_path(void) const
{
    const std::string::size_type last_slash = _repr.rfind('/');
    if (last_slash == std::string::npos)
        return path(".");
    else if (last_slash == 0)
        return path("/");
    else
        return path(_repr.substr(0, last_slash));
}


/// Gets the leaf name (base name) of the path.
///
/// \return A new string with the leaf name of the path.
std::string
fs::path::leaf_name(void) const
{
    const std::string::size_type last_slash = _repr.rfind('/');
    if (last_slash == std::string::npos || _repr == "/")
        return _repr;
    return _repr.substr(last_slash + 1);
}


/// Converts a relative path in the current directory to an absolute path.
///
/// \pre The path is relative.
///
/// \return The absolute representation of the relative path.
fs::path
fs::path::to_absolute(void) const
{
    PRE(!is_absolute());
    return fs::current_path() / *this;
}


/// Checks whether the path is absolute.
///
/// \return True if the path is absolute.
bool
fs::path::is_absolute(void) const
{
    return _repr[0] == '/';
}


/// Checks if two paths are equal.
///
/// \param p The path to compare to.
///
/// \return True if the two paths are equal; false otherwise.
bool
fs::path::operator==(const path& p) const
{
    return _repr == p._repr;
}


/// Checks if two paths are different.
///
/// \param p The path to compare to.
///
/// \return True if the two paths are different; false otherwise.
bool
fs::path::operator!=(const path& p) const
{
    return _repr != p._repr;
}


/// Less-than comparator for paths, to allow their use as keys of sets.
///
/// \param p The path to compare to.
///
/// \return True if this identifier sorts before the other identifier; false
///     otherwise.
bool
fs::path::operator<(const path& p) const
{
    return _repr < p._repr;
}


/// Concatenates this path with one or more components.
///
/// \param components The new components to concatenate to the path.  These are
///     normalized because, in general, they may come from user input.  These
///     components cannot represent an absolute path.
///
/// \return A new path containing the concatenation of this path and the
///     provided components.
///
/// \throw fs::invalid_path_error If components does not represent a valid
///     path.
/// \throw fs::join_error If the join operation is invalid because the two
///     paths are incompatible.
fs::path
fs::path::operator/(const std::string& components) const
{
    return (*this) / path(components);
}


/// Concatenates this path with another path.
///
/// \param rest The path to concatenate to this one.  Cannot be absolute.
///
/// \return A new path containing the concatenation of this path and the other
///     path.
///
/// \throw fs::join_error If the join operation is invalid because the two
///     paths are incompatible.
fs::path
fs::path::operator/(const path& rest) const
{
    if (rest.is_absolute())
        throw fs::join_error(_repr, rest._repr,
                             "Cannot concatenate a path to an absolute path");
    return path(_repr + '/' + rest._repr);
}


/// Formats a path for insertion on a stream.
///
/// \param os The output stream.
/// \param p The path to inject to the stream.
///
/// \return The output stream os.
std::ostream&
fs::operator<<(std::ostream& os, const fs::path& p)
{
    return (os << p.str());
}
