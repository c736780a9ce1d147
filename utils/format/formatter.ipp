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

#if !defined(UTILS_FORMAT_FORMATTER_IPP)
#define UTILS_FORMAT_FORMATTER_IPP

#include <iomanip>
#include <ostream>
#include <sstream>

#include "utils/format/formatter.hpp"

namespace utils {
namespace format {


/// Replaces the next placeholder of the format string with a value.
///
/// \param arg The value to format.  Its stream insertion operator is used,
///     after configuring the stream with the width and precision of the
///     placeholder.
///
/// \return A new formatter with one less placeholder.
///
/// \throw extra_args_error If there are no more placeholders to replace.
template< typename Type >
inline formatter
formatter::operator%(const Type& arg) const
{
    std::ostringstream oss;
    if (_width != -1)
        oss << std::setw(_width);
    if (_precision != -1)
        oss << std::fixed << std::setprecision(_precision);
    oss << arg;
    return replace(oss.str());
}


/// Inserts a formatter into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The formatter to format.
///
/// \return The output stream.
inline std::ostream&
operator<<(std::ostream& output, const formatter& object)
{
    return (output << object.str());
}


}  // namespace format
}  // namespace utils


#endif  // !defined(UTILS_FORMAT_FORMATTER_IPP)
