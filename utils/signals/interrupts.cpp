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

#include "utils/signals/interrupts.hpp"

extern "C" {
#include <sys/types.h>

#include <signal.h>
#include <unistd.h>
}

#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <thread>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/signals/programmer.hpp"

namespace signals = utils::signals;


namespace {


/// The interrupt signal that fired first, or -1 if none.
static std::atomic_int first_signal(-1);

/// The interrupt signal that fired last, or -1 if none.
static std::atomic_int last_signal(-1);

/// Counter for the number of interrupts received.
static std::atomic_int interrupt_count(0);

/// Counter for the number of termination requests received.
static std::atomic_int sigterm_count(0);

/// Signal mask to restore in new children.
static sigset_t global_old_sigmask;

/// Global mutex to protect the rest of the variables below.
static std::mutex mutex;

/// Set to true once the signals thread has finished setting up the handlers.
static bool started = false;

/// Condition variable to wait for started to be set to true.
static std::condition_variable cv;

/// The function to call upon the first interrupt.
static signals::interrupt_hook hook;


/// Handler for the interrupt signals, SIGHUP and SIGINT.
///
/// \param signo The signal that caused this handler to be called.
static void
interrupt_handler(const int signo)
{
    int expected = -1;
    (void)first_signal.compare_exchange_strong(expected, signo);
    last_signal = signo;
    interrupt_count += 1;
}


/// Handler for SIGTERM, which is only recorded.
static void
sigterm_handler(const int /* signo */)
{
    sigterm_count += 1;
}


/// Unique thread for signal handling.
///
/// This thread must be started with all signals disabled to ensure that it is
/// the only one reenabling signal handling.
///
/// The thread waits for signals.  Every SIGTERM is logged and otherwise
/// ignored.  The first SIGINT or SIGHUP runs the interrupt hook, which is
/// expected to make the program wind down on its own.  A second interrupt
/// restores the default handlers and redelivers itself to terminate the
/// program right away.
static void
signals_handling_thread(void)
{
    signals::programmer sighup_handler(SIGHUP, interrupt_handler);
    signals::programmer sigint_handler(SIGINT, interrupt_handler);
    signals::programmer sigterm_programmer(SIGTERM, sigterm_handler);

    ::sigset_t mask, old_mask;
    sigemptyset(&mask);
    const int ret = ::pthread_sigmask(SIG_SETMASK, &mask, &old_mask);
    INV(ret != -1);

    {
        std::unique_lock< std::mutex > lock(mutex);
        started = true;
        cv.notify_all();
    }

    int seen_sigterms = 0;
    bool hook_called = false;
    for (;;) {
        (void)::sigsuspend(&mask);

        while (seen_sigterms < sigterm_count) {
            ++seen_sigterms;
            LW(F("Received signal %s, ignoring it") % SIGTERM);
        }

        if (interrupt_count >= 1 && !hook_called) {
            hook_called = true;
            std::cerr << "[-- Signal caught; please wait for cleanup --]\n";
            LI(F("Received interrupt signal %s; stopping") % first_signal.load());
            hook(first_signal.load());
        }

        if (interrupt_count >= 2)
            break;
    }

    std::cerr << "[-- Double signal caught; terminating --]\n";
    sigterm_programmer.unprogram();
    sigint_handler.unprogram();
    sighup_handler.unprogram();
    ::kill(::getpid(), last_signal.load());
}


}  // anonymous namespace


/// Starts the signals handling thread to handle interrupts asynchronously.
///
/// This configures the program to funnel all signal handling through a single
/// thread, started here.  The given hook runs in that thread upon the first
/// interrupt, so it must be thread-safe and must not block for long.
///
/// This should be called early in the main thread, before any other threads
/// have been started, to ensure the right default signal mask is set for them.
///
/// \param hook_ The function to call upon the first interrupt.
void
signals::setup_interrupts(const interrupt_hook& hook_)
{
    PRE(!started);
    hook = hook_;

    ::sigset_t mask;
    sigfillset(&mask);
    const int ret = ::sigprocmask(SIG_BLOCK, &mask, &global_old_sigmask);
    INV(ret != -1);

    std::thread thread(signals_handling_thread);
    thread.detach();

    // Wait until the thread finishes starting up and configuring signal
    // handling to avoid losing early signals.
    std::unique_lock< std::mutex > lock(mutex);
    cv.wait(lock, []{return started;});
}


/// Clears interrupts handling in a new child.
///
/// This must be invoked right after fork() to ensure the child process can
/// receive signals.
void
signals::reset_interrupts_in_new_child(void)
{
    ::sigset_t mask;
    sigemptyset(&mask);
    const int ret = ::sigprocmask(SIG_SETMASK, started ? &global_old_sigmask :
                                  &mask, NULL);
    INV(ret != -1);
}


/// Queries the first interrupt signal received by the program.
///
/// \return The signal number, or -1 if no interrupt has been received.
int
signals::fired_signal(void)
{
    return first_signal;
}
