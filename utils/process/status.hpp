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

/// \file utils/process/status.hpp
/// Provides the utils::process::status class.

#if !defined(UTILS_PROCESS_STATUS_HPP)
#define UTILS_PROCESS_STATUS_HPP

#include <ostream>

namespace utils {
namespace process {


/// Representation of the termination status of a process.
///
/// The status keeps the raw value returned by the wait family of functions.
/// exit_code() and signal() decompose it without any preconditions, so that
/// callers that only care about "what numbers came back" do not have to
/// distinguish between the two termination modes.
class status {
    /// The PID of the process that generated this status.
    int _dead_pid;

    /// The raw status as returned by wait(2).
    int _stat_loc;

public:
    status(const int, int);
    static status fake_exited(const int);
    static status fake_signaled(const int, const bool);

    int dead_pid(void) const;

    bool exited(void) const;
    int exitstatus(void) const;

    bool signaled(void) const;
    int termsig(void) const;
    bool coredump(void) const;

    int exit_code(void) const;
    int signal(void) const;

    bool success(void) const;

    bool operator==(const status&) const;
    bool operator!=(const status&) const;
};


std::ostream& operator<<(std::ostream&, const status&);


}  // namespace process
}  // namespace utils

#endif  // !defined(UTILS_PROCESS_STATUS_HPP)
