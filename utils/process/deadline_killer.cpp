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

#include "utils/process/deadline_killer.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <thread>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/process/operations.hpp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace process = utils::process;


namespace {


/// Ordered collection of PIDs by the time they have to be killed.
typedef std::multimap< datetime::timestamp, int > deadlines_map;


/// Interval between two checks of the expired deadlines.
static const std::chrono::milliseconds poll_interval(100);


/// Global mutex to protect static fields.
static std::mutex mutex;

/// True if the killer thread has been started.  The thread is detached and left
/// running so this never becomes false again.
static bool started = false;

/// PIDs that have deadline_killer objects alive ordered by their deadline.
static deadlines_map deadlines;


/// Removes the PIDs whose deadline has expired from the pending set.
///
/// \return The PIDs to kill.
static std::set< int >
pop_expired(void)
{
    std::set< int > expired;

    std::lock_guard< std::mutex > lock(mutex);
    const datetime::timestamp now = datetime::timestamp::now();
    deadlines_map::iterator iter = deadlines.begin();
    while (iter != deadlines.end() && iter->first <= now) {
        expired.insert(iter->second);
        deadlines.erase(iter++);
    }

    return expired;
}


/// Body of the thread that kills process groups with expired deadlines.
static void
killer_thread(void)
{
    for (;;) {
        for (const int pid : pop_expired()) {
            LD(F("Deadline for process group %s expired; killing it") % pid);
            process::terminate_group(pid);
        }
        std::this_thread::sleep_for(poll_interval);
    }
}


}  // anonymous namespace


/// Schedules the death of a process group.
///
/// \param delta Time to the timer activation.
/// \param pid PID of the process (and process group) to kill.
process::deadline_killer::deadline_killer(const datetime::delta& delta,
                                          const int pid) :
    _pid(pid),
    _scheduled(false)
{
    std::lock_guard< std::mutex > lock(mutex);
    deadlines.insert(deadlines_map::value_type(
        datetime::timestamp::now() + delta, pid));
    if (!started) {
        std::thread thread(killer_thread);
        thread.detach();
        started = true;
    }

    _scheduled = true;
}


/// Destructor; unschedules the PID's death if still alive.
///
/// The caller should invoke unschedule() on its own to learn whether the
/// deadline fired or not.
process::deadline_killer::~deadline_killer(void)
{
    if (_scheduled) {
        LW("Destroying still-scheduled process::deadline_killer object");
        (void)unschedule();
    }
}


/// Unschedules the PID's death.
///
/// This can only be called once.
///
/// \return True if the process was killed because its deadline expired; false
/// otherwise.
bool
process::deadline_killer::unschedule(void)
{
    PRE(_scheduled);

    std::lock_guard< std::mutex > lock(mutex);
    bool pending = false;
    for (deadlines_map::iterator iter = deadlines.begin();
         iter != deadlines.end(); ++iter) {
        if (iter->second == _pid) {
            deadlines.erase(iter);
            pending = true;
            break;
        }
    }

    _scheduled = false;
    return !pending;
}
