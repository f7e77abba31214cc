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
    _exitstatus(WIFEXITED(stat_loc) ? WEXITSTATUS(stat_loc) : -1),
    _termsig(WIFSIGNALED(stat_loc) ? WTERMSIG(stat_loc) : -1),
    _coredump(WIFSIGNALED(stat_loc) ? WCOREDUMP(stat_loc) : false)
{
}


/// Constructs a new status object based on fake values.
///
/// \param exitstatus_ The exit code of the process, or -1 if not exited.
/// \param termsig_ The termination signal of the process, or -1 if not
///     signaled.
/// \param coredump_ Whether the process dumped core when signaled.
process::status::status(const int exitstatus_, const int termsig_,
                        const bool coredump_) :
    _dead_pid(-1),
    _exitstatus(exitstatus_),
    _termsig(termsig_),
    _coredump(coredump_)
{
}


/// Constructs a new status object based on a fake exit status.
///
/// \param exitstatus_ The exit code of the process.
///
/// \return A status object with fake data.
process::status
process::status::fake_exited(const int exitstatus_)
{
    return status(exitstatus_, -1, false);
}


/// Constructs a new status object based on a fake exit status.
///
/// \param termsig_ The termination signal of the process.
/// \param coredump_ Whether the process dumped core or not.
///
/// \return A status object with fake data.
process::status
process::status::fake_signaled(const int termsig_, const bool coredump_)
{
    return status(-1, termsig_, coredump_);
}


/// Returns the PID of the process this status was taken from.
///
/// \return A PID, or -1 if the status was faked.
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
    return _exitstatus != -1;
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
    return _exitstatus;
}


/// Returns whether the process terminated due to a signal or not.
///
/// \return True if the process terminated due to a signal, false otherwise.
bool
process::status::signaled(void) const
{
    return _termsig != -1;
}


/// Returns the signal that terminated the process.
///
/// \pre The process must have terminated by a signal.
///
/// \return The signal number.
int
process::status::termsig(void) const
{
    PRE(signaled());
    return _termsig;
}


/// Returns whether the process core dumped or not.
///
/// \pre The process must have terminated by a signal.
///
/// \return True if the process core dumped, false otherwise.
bool
process::status::coredump(void) const
{
    PRE(signaled());
    return _coredump;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param status The object to format.
///
/// \return The output stream.
std::ostream&
process::operator<<(std::ostream& output, const status& status)
{
    if (status.exited()) {
        output << F("status{exitstatus=%s}") % status.exitstatus();
    } else if (status.signaled()) {
        output << F("status{termsig=%s, coredump=%s}") % status.termsig() %
            status.coredump();
    } else {
        UNREACHABLE;
    }
    return output;
}
