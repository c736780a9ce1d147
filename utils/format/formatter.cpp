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

#include "utils/format/formatter.hpp"

#include <cctype>
#include <cstdlib>

#include "utils/format/exceptions.hpp"
#include "utils/sanity.hpp"

namespace format = utils::format;

using format::formatter;


namespace {


/// Type letters accepted after a percent sign.
static const std::string valid_types = "cdsu";


/// Locates the next placeholder of a string.
///
/// \param format The original format string, for error reporting.
/// \param expansion The string in which to look for placeholders.
/// \param [in,out] pos The position from which to start searching; on exit,
///     the position of the placeholder or npos if there is none.
/// \param [out] width The width of the placeholder, or -1 if not given.
/// \param [out] precision The precision of the placeholder, or -1.
///
/// \return The length of the placeholder, or 0 if there is none.
///
/// \throw bad_format_error If the placeholder is malformed.
static std::string::size_type
find_placeholder(const std::string& format, const std::string& expansion,
                 std::string::size_type& pos, int& width, int& precision)
{
    width = -1;
    precision = -1;

    pos = expansion.find('%', pos);
    while (pos != std::string::npos) {
        if (pos + 1 >= expansion.length())
            throw format::bad_format_error(format, "Trailing %");
        if (expansion[pos + 1] != '%')
            break;
        pos = expansion.find('%', pos + 2);
    }
    if (pos == std::string::npos)
        return 0;

    std::string::size_type end = pos + 1;
    std::string digits;
    while (end < expansion.length() && std::isdigit(expansion[end]))
        digits += expansion[end++];
    if (!digits.empty())
        width = std::atoi(digits.c_str());

    if (end < expansion.length() && expansion[end] == '.') {
        end++;
        digits.clear();
        while (end < expansion.length() && std::isdigit(expansion[end]))
            digits += expansion[end++];
        if (digits.empty())
            throw format::bad_format_error(format, "Missing precision");
        precision = std::atoi(digits.c_str());
    }

    if (end >= expansion.length() ||
        valid_types.find(expansion[end]) == std::string::npos)
        throw format::bad_format_error(
            format, "Unknown sequence '" + expansion.substr(pos, end - pos + 1) +
            "'");

    return end - pos + 1;
}


}  // anonymous namespace


/// Constructs a new formatter object (internal).
///
/// \param format The format string.
/// \param expansion The format string with any replacements performed so far.
/// \param last_pos The position from which to start looking for placeholders.
///     Text introduced by previous replacements is never scanned again, so a
///     replacement containing a percent sign is kept verbatim.
formatter::formatter(const std::string& format, const std::string& expansion,
                     const std::string::size_type last_pos) :
    _format(format),
    _expansion(expansion),
    _last_pos(last_pos)
{
    init();
}


/// Constructs a new formatter object.
///
/// \param format The format string.
///
/// \throw bad_format_error If the format string is invalid.
formatter::formatter(const std::string& format) :
    _format(format),
    _expansion(format),
    _last_pos(0)
{
    init();

    // Validate the remaining placeholders now so that errors in the format
    // string are raised even if the caller supplies no arguments.
    std::string::size_type pos = _placeholder_pos;
    while (pos != std::string::npos) {
        int width, precision;
        const std::string::size_type length = find_placeholder(
            _format, _expansion, pos, width, precision);
        if (length == 0)
            break;
        pos += length;
    }
}


/// Locates the next placeholder and records its properties.
void
formatter::init(void)
{
    _placeholder_pos = _last_pos;
    _placeholder_length = find_placeholder(_format, _expansion,
                                           _placeholder_pos, _width,
                                           _precision);
    if (_placeholder_length == 0)
        _placeholder_pos = std::string::npos;
}


/// Returns the formatted string.
///
/// \return The expansion with all %% escapes collapsed.
std::string
formatter::str(void) const
{
    std::string out = _expansion;

    std::string::size_type pos = out.find('%');
    while (pos != std::string::npos && pos + 1 < out.length()) {
        if (out[pos + 1] == '%')
            out.erase(pos, 1);
        pos = out.find('%', pos + 1);
    }
    return out;
}


/// Automatic conversion of formatter objects to strings.
///
/// This allows passing formatters wherever a string is expected without
/// calling str() explicitly.
formatter::operator std::string(void) const
{
    return str();
}


/// Replaces the next placeholder with a boolean value.
///
/// \param arg The value to format.
///
/// \return A new formatter with one less placeholder.
formatter
formatter::operator%(const bool& arg) const
{
    return replace(arg ? "true" : "false");
}


/// Replaces the next placeholder with an already-formatted string.
///
/// \param arg The replacement string.
///
/// \return A new formatter positioned after the replaced text.
///
/// \throw extra_args_error If there are no more placeholders in the string.
formatter
formatter::replace(const std::string& arg) const
{
    if (_placeholder_pos == std::string::npos)
        throw format::extra_args_error(_format, arg);

    const std::string expansion = _expansion.substr(0, _placeholder_pos) +
        arg + _expansion.substr(_placeholder_pos + _placeholder_length);
    return formatter(_format, expansion, _placeholder_pos + arg.length());
}
