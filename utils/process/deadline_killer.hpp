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

/// \file utils/process/deadline_killer.hpp
/// Timer to kill a process on activation.

#if !defined(UTILS_PROCESS_DEADLINE_KILLER_HPP)
#define UTILS_PROCESS_DEADLINE_KILLER_HPP

#include "utils/datetime.hpp"
#include "utils/noncopyable.hpp"

namespace utils {
namespace process {


/// Timer that forcibly kills a process group on activation.
///
/// The killing is performed by a single background thread shared by all the
/// deadline_killer objects, which checks for expired deadlines periodically.
class deadline_killer : noncopyable {
    /// PID of the process (and process group) to kill.
    const int _pid;

    /// Whether the deadline is still scheduled or not.
    bool _scheduled;

public:
    deadline_killer(const datetime::delta&, const int);
    ~deadline_killer(void);

    bool unschedule(void);
};


}  // namespace process
}  // namespace utils

#endif  // !defined(UTILS_PROCESS_DEADLINE_KILLER_HPP)
