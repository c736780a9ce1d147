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

#include "model/run.hpp"

#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/text/operations.ipp"

namespace fs = utils::fs;
namespace text = utils::text;

using utils::optional;


/// Constructs a new run.
///
/// \param task_ The input file analyzed by the tool.
/// \param options_ Tool options, in command-line order.
/// \param property_file_ Property file to pass to the tool, if any.
/// \param log_file_ File that receives the output of the tool.
model::run::run(const fs::path& task_,
                const std::vector< std::string >& options_,
                const optional< fs::path >& property_file_,
                const fs::path& log_file_) :
    _task(task_),
    _options(options_),
    _property_file(property_file_),
    _log_file(log_file_)
{
}


/// \return The input file analyzed by the tool.
const fs::path&
model::run::task(void) const
{
    return _task;
}


/// \return The tool options for this run.
const std::vector< std::string >&
model::run::options(void) const
{
    return _options;
}


/// \return The property file to pass to the tool, if any.
const optional< fs::path >&
model::run::property_file(void) const
{
    return _property_file;
}


/// \return The file that receives the output of the tool.
const fs::path&
model::run::log_file(void) const
{
    return _log_file;
}


/// Equality comparator.
///
/// \param other The object to compare to.
///
/// \return True if the two objects are equal; false otherwise.
bool
model::run::operator==(const run& other) const
{
    return _task == other._task && _options == other._options &&
        _property_file == other._property_file &&
        _log_file == other._log_file;
}


/// Inequality comparator.
///
/// \param other The object to compare to.
///
/// \return True if the two objects are different; false otherwise.
bool
model::run::operator!=(const run& other) const
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
model::operator<<(std::ostream& output, const run& object)
{
    output << F("model::run{task=%s, options=[%s], log_file=%s}")
        % text::quote(object.task().str(), '\'')
        % text::join(object.options(), ", ")
        % text::quote(object.log_file().str(), '\'');
    return output;
}
