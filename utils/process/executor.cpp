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

#include "utils/process/executor.hpp"

#include <memory>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/child.hpp"
#include "utils/process/deadline_killer.hpp"
#include "utils/process/exceptions.hpp"
#include "utils/process/operations.hpp"

namespace datetime = utils::datetime;
namespace executor = utils::process::executor;
namespace fs = utils::fs;
namespace process = utils::process;

using utils::none;
using utils::optional;


/// Constructor.
///
/// \param status_ Termination status of the subprocess, or none if it was
///     killed because its deadline expired.
/// \param output_ Multiplexed stdout and stderr of the subprocess.
/// \param start_time_ Time when the subprocess was started.
/// \param end_time_ Time when the subprocess was reaped.
executor::exit_handle::exit_handle(
    const optional< process::status >& status_,
    const std::string& output_,
    const datetime::timestamp& start_time_,
    const datetime::timestamp& end_time_) :
    _status(status_),
    _output(output_),
    _start_time(start_time_),
    _end_time(end_time_)
{
}


/// Returns the termination status of the subprocess.
///
/// \return The status, or none if the subprocess timed out.
const optional< process::status >&
executor::exit_handle::status(void) const
{
    return _status;
}


/// Returns whether the subprocess was killed due to its deadline.
///
/// \return True if the subprocess timed out.
bool
executor::exit_handle::timed_out(void) const
{
    return !_status;
}


/// \return The multiplexed stdout and stderr of the subprocess.
const std::string&
executor::exit_handle::output(void) const
{
    return _output;
}


/// \return The time when the subprocess was started.
const datetime::timestamp&
executor::exit_handle::start_time(void) const
{
    return _start_time;
}


/// \return The time when the subprocess was reaped.
const datetime::timestamp&
executor::exit_handle::end_time(void) const
{
    return _end_time;
}


/// Executes a binary and waits for its completion.
///
/// \param program Path to the binary to execute.
/// \param args Arguments to the binary, not including the program name.
/// \param timeout Maximum amount of time the subprocess can run for.
/// \param work_directory If set, directory to run the binary in.
///
/// \return A handle describing the termination of the subprocess.
///
/// \throw process::system_error If the subprocess cannot be spawned or waited
///     for.
executor::exit_handle
executor::run(const fs::path& program, const args_vector& args,
              const datetime::delta& timeout,
              const optional< fs::path >& work_directory)
{
    const datetime::timestamp start_time = datetime::timestamp::now();
    std::unique_ptr< process::child > child = process::child::fork_capture(
        program, args, work_directory);

    process::deadline_killer timer(timeout, child->pid());
    std::string output;
    try {
        output = child->read_output();
    } catch (const process::error& e) {
        process::terminate_group(child->pid());
        (void)child->wait();
        timer.unschedule();
        throw;
    }
    const process::status status = child->wait();
    const datetime::timestamp end_time = datetime::timestamp::now();

    if (timer.unschedule()) {
        LI(F("Subprocess %s timed out after %s") % program % timeout);
        return exit_handle(none, output, start_time, end_time);
    } else {
        LD(F("Subprocess %s terminated with %s") % program % status);
        return exit_handle(utils::make_optional(status), output, start_time,
                           end_time);
    }
}
