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

#include "model/run_result.hpp"

#include "utils/format/macros.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;
namespace process = utils::process;

using utils::optional;


/// Constructs a new run result.
///
/// \param status_ The termination status of the tool, or none if the tool
///     could not be started.
/// \param timed_out_ Whether the tool exceeded its time limit.
/// \param wall_time_ Wall-clock time consumed by the tool.
/// \param cpu_time_ CPU time consumed by the tool.
/// \param output_ Lines printed by the tool.
/// \param verdict_ The classified outcome.
model::run_result::run_result(const optional< process::status >& status_,
                              const bool timed_out_,
                              const datetime::delta& wall_time_,
                              const datetime::delta& cpu_time_,
                              const std::vector< std::string >& output_,
                              const model::verdict& verdict_) :
    _status(status_),
    _timed_out(timed_out_),
    _wall_time(wall_time_),
    _cpu_time(cpu_time_),
    _output(output_),
    _verdict(verdict_)
{
}


/// \return The termination status of the tool, if it ever ran.
const optional< process::status >&
model::run_result::status(void) const
{
    return _status;
}


/// \return Whether the tool exceeded its time limit.
bool
model::run_result::timed_out(void) const
{
    return _timed_out;
}


/// \return The wall-clock time consumed by the tool.
const datetime::delta&
model::run_result::wall_time(void) const
{
    return _wall_time;
}


/// \return The CPU time consumed by the tool.
const datetime::delta&
model::run_result::cpu_time(void) const
{
    return _cpu_time;
}


/// \return The lines printed by the tool.
const std::vector< std::string >&
model::run_result::output(void) const
{
    return _output;
}


/// \return The classified outcome of the run.
const model::verdict&
model::run_result::get_verdict(void) const
{
    return _verdict;
}


/// Returns the exit code of the tool.
///
/// \return The exit code, or 0 if the tool did not terminate on its own.
int
model::run_result::exit_code(void) const
{
    return _status ? _status.get().exit_code() : 0;
}


/// Returns the signal that terminated the tool.
///
/// \return The signal number, or 0 if the tool was not signaled.
int
model::run_result::signal(void) const
{
    return _status ? _status.get().signal() : 0;
}


/// Equality comparator.
///
/// \param other The object to compare to.
///
/// \return True if the two objects are equal; false otherwise.
bool
model::run_result::operator==(const run_result& other) const
{
    return _status == other._status && _timed_out == other._timed_out &&
        _wall_time == other._wall_time && _cpu_time == other._cpu_time &&
        _output == other._output && _verdict == other._verdict;
}


/// Inequality comparator.
///
/// \param other The object to compare to.
///
/// \return True if the two objects are different; false otherwise.
bool
model::run_result::operator!=(const run_result& other) const
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
model::operator<<(std::ostream& output, const run_result& object)
{
    output << F("model::run_result{exit_code=%s, signal=%s, timed_out=%s, "
                "wall_time=%s, cpu_time=%s, verdict=%s}")
        % object.exit_code() % object.signal() % object.timed_out()
        % object.wall_time() % object.cpu_time() % object.get_verdict();
    return output;
}
