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

#include "utils/process/status.hpp"

extern "C" {
#include <sys/wait.h>
}

#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"

namespace process = utils::process;


/// Constructs a new status object based on the status value of waitpid(2).
///
/// \param dead_pid_ The PID of the process this status belonged to.
/// \param stat_loc The status value returnd by waitpid(2).
process::status::status(const int dead_pid_, int stat_loc) :
    _dead_pid(dead_pid_),
    _stat_loc(stat_loc)
{
}


/// Creates a status object based on a normal termination.
///
/// \param exitstatus_ The exit code of the process.
///
/// \return A status object with fake data.
process::status
process::status::fake_exited(const int exitstatus_)
{
    PRE(exitstatus_ >= 0 && exitstatus_ <= 255);
    return status(-1, exitstatus_ << 8);
}


/// Creates a status object based on an abnormal termination.
///
/// \param termsig_ The termination signal of the process.
/// \param coredump_ Whether the process dumped core or not.
///
/// \return A status object with fake data.
process::status
process::status::fake_signaled(const int termsig_, const bool coredump_)
{
    PRE(termsig_ > 0 && termsig_ < 0x7f);
    return status(-1, termsig_ | (coredump_ ? 0x80 : 0));
}


/// Returns the PID of the process this status was taken from.
///
/// Please note that the caller must be careful when using this value.  If the
/// process was reaped, the PID may have been reused by the system.
///
/// \return The PID, or -1 if the status was fabricated.
int
process::status::dead_pid(void) const
{
    return _dead_pid;
}


/// Returns whether the process exited cleanly or not.
///
/// \return True if the process exited cleanly, false otherwise.
bool
process::status::exited(void) const
{
    return WIFEXITED(_stat_loc);
}


/// Returns the exit code of the process.
///
/// \pre The process must have exited cleanly (i.e. exited() must be true).
///
/// \return The exit code.
int
process::status::exitstatus(void) const
{
    PRE(exited());
    return WEXITSTATUS(_stat_loc);
}


/// Returns whether the process terminated due to a signal or not.
///
/// \return True if the process terminated due to a signal, false otherwise.
bool
process::status::signaled(void) const
{
    return WIFSIGNALED(_stat_loc);
}


/// Returns the signal that terminated the process.
///
/// \pre The process must have terminated by a signal (i.e. signaled() must be
///     true.
///
/// \return The signal number.
int
process::status::termsig(void) const
{
    PRE(signaled());
    return WTERMSIG(_stat_loc);
}


/// Returns whether the process core dumped or not.
///
/// This functionality may be unsupported in some platforms.  In such cases,
/// this method returns false unconditionally.
///
/// \pre The process must have terminated by a signal (i.e. signaled() must be
///     true.
///
/// \return True if the process dumped core, false otherwise.
bool
process::status::coredump(void) const
{
    PRE(signaled());
#if defined(WCOREDUMP)
    return WCOREDUMP(_stat_loc);
#else
    return false;
#endif
}


/// \return The exit code part of the raw status; 0 if killed by a signal.
int
process::status::exit_code(void) const
{
    return (_stat_loc >> 8) & 0xff;
}


/// \return The signal part of the raw status; 0 if it exited normally.
int
process::status::signal(void) const
{
    return _stat_loc & 0x7f;
}


/// \return True if the process exited cleanly with a code of zero.
bool
process::status::success(void) const
{
    return _stat_loc == 0;
}


/// Checks two statuses for equality, ignoring the PIDs.
///
/// \param other The status to compare to.
///
/// \return True if both statuses carry the same raw value.
bool
process::status::operator==(const status& other) const
{
    return _stat_loc == other._stat_loc;
}


/// Checks two statuses for inequality, ignoring the PIDs.
///
/// \param other The status to compare to.
///
/// \return True if the statuses carry different raw values.
bool
process::status::operator!=(const status& other) const
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
process::operator<<(std::ostream& output, const status& object)
{
    output << F("status{exit_code=%s, signal=%s}") % object.exit_code() %
        object.signal();
    return output;
}
