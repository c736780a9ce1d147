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

#include "model/verdict.hpp"

#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/text/operations.ipp"

namespace text = utils::text;


/// Constructs a verdict of the closed taxonomy.
///
/// \param type_ The type of the verdict.  Cannot be error; use make_error()
///     for those instead.
model::verdict::verdict(const verdict_type type_) :
    _type(type_)
{
    PRE_MSG(type_ != error, "Error verdicts need a reason");
}


/// Constructs an error verdict.
///
/// \param reason_ The textual reason of the error, such as "timeout".  Cannot
///     be empty.
///
/// \return A new error verdict.
model::verdict
model::verdict::make_error(const std::string& reason_)
{
    PRE(!reason_.empty());
    verdict result(unknown);
    result._type = error;
    result._reason = reason_;
    return result;
}


/// Returns the type of the verdict.
///
/// \return A verdict type.
model::verdict::verdict_type
model::verdict::type(void) const
{
    return _type;
}


/// Returns the reason explaining an error verdict.
///
/// \return A textual reason; empty for non-error verdicts.
const std::string&
model::verdict::reason(void) const
{
    return _reason;
}


/// Returns the canonical textual representation of the verdict.
///
/// \return The string used in reports and result databases.  For errors, this
/// is the reason itself.
std::string
model::verdict::str(void) const
{
    switch (_type) {
    case true_prop: return "true";
    case false_reach: return "false(reach)";
    case false_deref: return "false(valid-deref)";
    case false_free: return "false(valid-free)";
    case false_termination: return "false(termination)";
    case unknown: return "unknown";
    case error: return _reason;
    }
    UNREACHABLE;
}


/// \return True if the verdict is an error.
bool
model::verdict::is_error(void) const
{
    return _type == error;
}


/// \return True if the verdict claims that a property is violated.
bool
model::verdict::is_false(void) const
{
    switch (_type) {
    case false_reach:
    case false_deref:
    case false_free:
    case false_termination:
        return true;

    case true_prop:
    case unknown:
    case error:
        return false;
    }
    UNREACHABLE;
}


/// Equality comparator.
///
/// \param other The verdict to compare to.
///
/// \return True if the other object is equal to this one, false otherwise.
bool
model::verdict::operator==(const verdict& other) const
{
    return _type == other._type && _reason == other._reason;
}


/// Inequality comparator.
///
/// \param other The verdict to compare to.
///
/// \return True if the other object is different from this one, false
/// otherwise.
bool
model::verdict::operator!=(const verdict& other) const
{
    return !(*this == other);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const verdict& object)
{
    output << F("model::verdict{%s}") % text::quote(object.str(), '\'');
    return output;
}
