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

/// \file utils/format/formatter.hpp
/// Provides the definition of the utils::format::formatter class.
///
/// The formatter is a small printf-like string builder with type safety:
/// arguments are injected one at a time with operator%, and each of them
/// replaces the next placeholder of the format string.

#if !defined(UTILS_FORMAT_FORMATTER_HPP)
#define UTILS_FORMAT_FORMATTER_HPP

#include <string>

namespace utils {
namespace format {


/// Mechanism to format strings similar to printf.
///
/// Supported placeholders are %c, %d, %s and %u, optionally carrying a width
/// and a precision as in "%5s" or "%.2s", plus the %% escape.  The type letter
/// is informational only: every argument is formatted through its stream
/// insertion operator.
///
/// \code
/// const std::string s = (formatter("%s took %.2s seconds") % name % 3.14159);
/// \endcode
class formatter {
    /// The format string as provided by the user.
    std::string _format;

    /// The format string with the placeholders replaced so far.
    std::string _expansion;

    /// Position from which to search for the next placeholder.
    std::string::size_type _last_pos;

    /// Position of the next placeholder, or npos if there is none.
    std::string::size_type _placeholder_pos;

    /// Length of the next placeholder.
    std::string::size_type _placeholder_length;

    /// Width of the next placeholder, or -1 if unspecified.
    int _width;

    /// Precision of the next placeholder, or -1 if unspecified.
    int _precision;

    formatter(const std::string&, const std::string&,
              const std::string::size_type);
    void init(void);
    formatter replace(const std::string&) const;

public:
    explicit formatter(const std::string&);

    std::string str(void) const;
    operator std::string(void) const;

    template< typename Type > formatter operator%(const Type&) const;
    formatter operator%(const bool&) const;
};


}  // namespace format
}  // namespace utils


#endif  // !defined(UTILS_FORMAT_FORMATTER_HPP)
