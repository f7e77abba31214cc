// Copyright 2012 Google Inc.
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
#include <condition_variable>
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
typedef std::multimap< datetime::timestamp, int > pids_by_deadline_map;

/// Global mutex to protect static fields.
static std::mutex mutex;

/// Signaled whenever a new deadline is registered.
static std::condition_variable deadlines_changed;

/// True if the killer thread has been started.  The thread is detached and left
/// running so this never becomes false again.
static bool started = false;

/// PIDs that have deadline_killer objects alive ordered by their deadline.
static pids_by_deadline_map pids_by_deadline;


/// Extracts the PIDs whose deadline has expired.
///
/// \pre The caller must hold the global mutex.
///
/// \param now The current time.
///
/// \return A collection of PIDs, which are removed from the global map.
static std::set< int >
extract_expired(const datetime::timestamp& now)
{
    std::set< int > pids_to_kill;

    auto iter = pids_by_deadline.begin();
    while (iter != pids_by_deadline.end() && iter->first <= now) {
        pids_to_kill.insert(iter->second);

        auto previous = iter;
        ++iter;
        pids_by_deadline.erase(previous);
    }

    return pids_to_kill;
}


/// Thread that kills PIDs with expired deadlines.
///
/// The thread sleeps until the earliest registered deadline or until a new
/// deadline is registered, whichever happens first.
static void
killer_thread(void)
{
    std::unique_lock< std::mutex > lock(mutex);
    for (;;) {
        if (pids_by_deadline.empty()) {
            deadlines_changed.wait(lock);
            continue;
        }

        const datetime::timestamp now = datetime::timestamp::now();
        const datetime::timestamp next = pids_by_deadline.begin()->first;
        if (now < next) {
            deadlines_changed.wait_for(
                lock, std::chrono::microseconds((next - now).to_microseconds()));
            continue;
        }

        const std::set< int > pids_to_kill = extract_expired(now);
        lock.unlock();
        for (auto pid : pids_to_kill) {
            LI(F("Deadline expired for PID %s; killing its process group") %
               pid);
            process::terminate_group(pid);
        }
        lock.lock();
    }
}


}  // anonymous namespace


/// Constructor.
///
/// \param delta Time to the timer activation.
/// \param pid PID of the process (and process group) to kill.
process::deadline_killer::deadline_killer(const datetime::delta& delta,
                                          const int pid) :
    _pid(pid)
{
    std::lock_guard< std::mutex > lock(mutex);
    const datetime::timestamp now = datetime::timestamp::now();
    pids_by_deadline.insert(pids_by_deadline_map::value_type(now + delta, pid));
    if (!started) {
        std::thread thread(killer_thread);
        thread.detach();
        started = true;
    }
    deadlines_changed.notify_one();

    _scheduled = true;
}


/// Destructor; unschedules the PID's death if still alive.
///
/// Given that this is a destructor and it can't report errors back to the
/// caller, the caller must attempt to call unschedule() on its own.
process::deadline_killer::~deadline_killer(void)
{
    if (_scheduled) {
        LW("Destroying still-scheduled process::deadline_killer object");
        unschedule();
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
    bool found = false;
    for (auto iter = pids_by_deadline.begin(); iter != pids_by_deadline.end();
         ++iter) {
        if (iter->second == _pid) {
            pids_by_deadline.erase(iter);
            found = true;
            break;
        }
    }

    _scheduled = false;

    return !found;
}
