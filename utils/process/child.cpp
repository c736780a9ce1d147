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

#include "utils/process/child.ipp"

extern "C" {
#include <sys/stat.h>

#include <fcntl.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <iostream>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/process/exceptions.hpp"
#include "utils/process/operations.hpp"
#include "utils/sanity.hpp"
#include "utils/signals/interrupts.hpp"


namespace utils {
namespace process {


/// Private implementation fields for child objects.
struct child::impl : utils::noncopyable {
    /// The process identifier.
    pid_t _pid;

    /// CPU time consumed by the child; only valid after wait().
    datetime::delta _cpu_time;

    /// Initializes private implementation data.
    ///
    /// \param pid The process identifier.
    impl(const pid_t pid) : _pid(pid) {}
};


}  // namespace process
}  // namespace utils


namespace fs = utils::fs;
namespace process = utils::process;
namespace signals = utils::signals;


namespace {


/// Exception-based version of dup(2).
///
/// \param old_fd The file descriptor to duplicate.
/// \param new_fd The file descriptor to use as the duplicate.  This is
///     closed if it was open before the copy happens.
///
/// \throw process::system_error If the call to dup2(2) fails.
static void
safe_dup(const int old_fd, const int new_fd)
{
    if (::dup2(old_fd, new_fd) == -1) {
        const int original_errno = errno;
        throw process::system_error(F("dup2(%s, %s) failed") % old_fd % new_fd,
                                    original_errno);
    }
}


/// Exception-based version of open(2) to open (or create) a file for append.
///
/// \param filename The file to open in append mode.
///
/// \return The file descriptor for the opened or created file.
///
/// \throw process::system_error If the call to open(2) fails.
static int
open_for_append(const fs::path& filename)
{
    const int fd = ::open(filename.c_str(), O_CREAT | O_WRONLY | O_APPEND,
                          S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (fd == -1) {
        const int original_errno = errno;
        throw process::system_error(F("Failed to create %s because open(2) "
                                      "failed") % filename, original_errno);
    }
    return fd;
}


/// Prepares the current process to run a child hook.
///
/// This creates a new process group, restores the signal mask and redirects
/// the standard output and error channels to the given files.  Both files may
/// be the same one.
///
/// \param stdout_file The name of the file in which to store the stdout.
/// \param stderr_file The name of the file in which to store the stderr.
///
/// \throw process::system_error If any of the setup steps fails.
static void
prepare_child(const fs::path& stdout_file, const fs::path& stderr_file)
{
    if (::setpgid(::getpid(), ::getpid()) == -1) {
        const int original_errno = errno;
        throw process::system_error("Failed to set process group",
                                    original_errno);
    }

    signals::reset_interrupts_in_new_child();

    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd == -1) {
        const int original_errno = errno;
        throw process::system_error("Failed to open /dev/null",
                                    original_errno);
    }
    safe_dup(null_fd, STDIN_FILENO);
    ::close(null_fd);

    const int stdout_fd = open_for_append(stdout_file);
    safe_dup(stdout_fd, STDOUT_FILENO);
    ::close(stdout_fd);

    const int stderr_fd = open_for_append(stderr_file);
    safe_dup(stderr_fd, STDERR_FILENO);
    ::close(stderr_fd);
}


}  // anonymous namespace


/// Logs an error in case of a failure and aborts the program.
void
process::detail::report_error_and_abort(void)
{
    std::cerr << "Caught unknown exception\n";
    std::abort();
}


/// Logs an error in case of a failure and aborts the program.
///
/// \param error The error to log.
void
process::detail::report_error_and_abort(const std::runtime_error& error)
{
    std::cerr << "Caught runtime_error: " << error.what() << "\n";
    std::abort();
}


/// Creates a new child.
///
/// \param implptr A dynamically-allocated impl object with the contents of the
///     new child.
process::child::child(impl *implptr) :
    _pimpl(implptr)
{
}


/// Destructor for child.
process::child::~child(void)
{
}


/// Helper function for fork_files().
///
/// Please note that if you update this function to change the return type or
/// to raise different errors, you will also have to update fork_files()
/// accordingly.
///
/// \param stdout_file The name of the file in which to store the stdout.
/// \param stderr_file The name of the file in which to store the stderr.
///
/// \return In the context of the parent process, a new child object returned
/// as a dynamically-allocated object because children classes are unique and
/// thus noncopyable.  In the context of the child process, a null pointer.
///
/// \throw process::system_error If the process cannot be spawned due to a
///     system call error.
std::unique_ptr< process::child >
process::child::fork_files_aux(const fs::path& stdout_file,
                               const fs::path& stderr_file)
{
    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int original_errno = errno;
        throw process::system_error("fork(2) failed", original_errno);
    } else if (pid == 0) {
        try {
            prepare_child(stdout_file, stderr_file);
        } catch (const std::runtime_error& e) {
            detail::report_error_and_abort(e);
        }
        return std::unique_ptr< process::child >();
    } else {
        LD(F("Spawned process %s: stdout=%s, stderr=%s") % pid % stdout_file %
           stderr_file);
        // Set the group from the parent too to close the race with an early
        // terminate_group() call.
        (void)::setpgid(pid, pid);
        return std::unique_ptr< process::child >(
            new process::child(new impl(pid)));
    }
}


/// Returns the process identifier of this child.
///
/// \return A process identifier.
int
process::child::pid(void) const
{
    return _pimpl->_pid;
}


/// Blocks to wait for completion.
///
/// \return The termination status of the child process.
///
/// \throw process::system_error If the call to wait4(2) fails.
process::status
process::child::wait(void)
{
    return process::wait(_pimpl->_pid, &_pimpl->_cpu_time);
}


/// Returns the CPU time consumed by the child.
///
/// \pre wait() must have returned successfully.
///
/// \return The user plus system time of the child.
const utils::datetime::delta&
process::child::cpu_time(void) const
{
    return _pimpl->_cpu_time;
}
