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

#include "utils/process/operations.hpp"

extern "C" {
#include <sys/types.h>
#include <sys/wait.h>

#include <signal.h>
}

#include <cerrno>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/process/exceptions.hpp"

namespace process = utils::process;


/// Forcibly kills a process group started by us.
///
/// This function is safe to call from a signal handler context.
///
/// Pretty much all of our subprocesses run in their own process group so that
/// we can terminate them and their children should we need to.  Because of
/// this, the very first thing our subprocesses do is create a new process
/// group for themselves.
///
/// The implication of the above is that simply issuing a killpg() call on the
/// process group is racy: if the subprocess has not yet had a chance to prepare
/// its own process group, then this call will fail and no subprocess will be
/// killed.  Hence we fall back to killing the process itself.
///
/// \param pgid PID or process group ID to terminate.
void
process::terminate_group(const int pgid)
{
    if (::killpg(pgid, SIGKILL) == -1) {
        (void)::kill(pgid, SIGKILL);
    }
}


/// Blocks to wait for completion of a subprocess.
///
/// \param pid Specific PID to wait for.
///
/// \return The termination status of the child process that terminated.
///
/// \throw process::system_error If the call to waitpid(2) fails.
process::status
process::wait(const int pid)
{
    LD(F("Waiting for pid=%s") % pid);
    int stat_loc;
    pid_t ret;
    do {
        ret = ::waitpid(pid, &stat_loc, 0);
    } while (ret == -1 && errno == EINTR);
    if (ret == -1) {
        const int original_errno = errno;
        throw process::system_error(F("Failed to wait for PID %s") % pid,
                                    original_errno);
    }
    return process::status(pid, stat_loc);
}
