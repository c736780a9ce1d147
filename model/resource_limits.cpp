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

#include "model/resource_limits.hpp"

#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

using utils::none;
using utils::optional;


/// Constructs a set of limits with no limit enforced.
model::resource_limits::resource_limits(void) :
    _time_limit(none),
    _memory_limit(none),
    _core_limit(none)
{
}


/// Constructs a set of limits.
///
/// \param time_limit_ Time limit in seconds, if any.  Must be positive.
/// \param memory_limit_ Memory limit in megabytes, if any.  Must be positive.
/// \param core_limit_ Limit on the number of cores, if any.  Must be positive.
model::resource_limits::resource_limits(const optional< int >& time_limit_,
                                        const optional< int >& memory_limit_,
                                        const optional< int >& core_limit_) :
    _time_limit(time_limit_),
    _memory_limit(memory_limit_),
    _core_limit(core_limit_)
{
    PRE(!time_limit_ || time_limit_.get() > 0);
    PRE(!memory_limit_ || memory_limit_.get() > 0);
    PRE(!core_limit_ || core_limit_.get() > 0);
}


/// \return The time limit in seconds, if any.
const optional< int >&
model::resource_limits::time_limit(void) const
{
    return _time_limit;
}


/// \return The memory limit in megabytes, if any.
const optional< int >&
model::resource_limits::memory_limit(void) const
{
    return _memory_limit;
}


/// \return The core limit, if any.
const optional< int >&
model::resource_limits::core_limit(void) const
{
    return _core_limit;
}


/// Equality comparator.
///
/// \param other The object to compare to.
///
/// \return True if the two objects are equal; false otherwise.
bool
model::resource_limits::operator==(const resource_limits& other) const
{
    return _time_limit == other._time_limit &&
        _memory_limit == other._memory_limit &&
        _core_limit == other._core_limit;
}


/// Inequality comparator.
///
/// \param other The object to compare to.
///
/// \return True if the two objects are different; false otherwise.
bool
model::resource_limits::operator!=(const resource_limits& other) const
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
model::operator<<(std::ostream& output, const resource_limits& object)
{
    output << F("model::resource_limits{time_limit=%s, memory_limit=%s, "
                "core_limit=%s}")
        % object.time_limit() % object.memory_limit() % object.core_limit();
    return output;
}
