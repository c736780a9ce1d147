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

#include "utils/process/operations.hpp"

extern "C" {
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <signal.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/process/exceptions.hpp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace process = utils::process;


/// Maximum number of arguments supported by exec.
///
/// We need this limit to avoid having to allocate dynamic memory in the child
/// process to construct the arguments list.
#define MAX_ARGS 256


/// Executes an external binary and replaces the current process.
///
/// This function must not use any of the logging features so that the output
/// of the subprocess is not "polluted" by our own messages.
///
/// \param program The binary to execute.
/// \param args The arguments to pass to the binary, without the program name.
void
process::exec(const fs::path& program, const args_vector& args) throw()
{
    if (args.size() >= MAX_ARGS) {
        std::cerr << "Failed to execute " << program << ": too many "
            "arguments\n";
        std::abort();
    }

    const char* argv[MAX_ARGS + 1];
    argv[0] = program.c_str();
    for (args_vector::size_type i = 0; i < args.size(); i++)
        argv[1 + i] = args[i].c_str();
    argv[1 + args.size()] = NULL;

    (void)::execv(program.c_str(), const_cast< char* const* >(argv));
    const int original_errno = errno;

    std::cerr << "Failed to execute " << program << ": "
              << std::strerror(original_errno) << "\n";
    std::abort();
}


/// Forcibly kills a process group started by us.
///
/// This function is safe to call from an signal handler context.
///
/// Pretty much all of our subprocesses run in their own process group so that
/// we can terminate them and thier children should we need to.  Because of
/// this, the very first thing our subprocesses do is create a new process group
/// for themselves.
///
/// The implication of the above is that simply issuing a killpg() call on the
/// process group is racy: if the subprocess has not yet had a chance to prepare
/// its own process group, then this killpg() will fail.  Therefore, we kill
/// both the process and the group.
///
/// \param pgid PID or process group ID to kill.
void
process::terminate_group(const int pgid)
{
    (void)::kill(pgid, SIGKILL);
    (void)::killpg(pgid, SIGKILL);
}


/// Blocks to wait for completion of a subprocess.
///
/// \param pid Identifier of the process to wait for.
/// \param [out] cpu_time If not NULL, receives the user plus system time
///     consumed by the process and its awaited descendants.
///
/// \return The termination status of the child process that terminated.
///
/// \throw process::system_error If the call to wait4(2) fails.
process::status
process::wait(const int pid, datetime::delta* cpu_time)
{
    LD(F("Waiting for pid=%s") % pid);

    int stat_loc;
    ::rusage usage;
    pid_t ret;
    do {
        ret = ::wait4(pid, &stat_loc, 0, &usage);
    } while (ret == -1 && errno == EINTR);
    if (ret == -1) {
        const int original_errno = errno;
        throw process::system_error(F("Failed to wait for PID %s") % pid,
                                    original_errno);
    }

    if (cpu_time != NULL) {
        *cpu_time = datetime::delta(usage.ru_utime.tv_sec,
                                    usage.ru_utime.tv_usec) +
            datetime::delta(usage.ru_stime.tv_sec, usage.ru_stime.tv_usec);
    }
    return process::status(ret, stat_loc);
}
