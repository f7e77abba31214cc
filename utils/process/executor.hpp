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

/// \file utils/process/executor.hpp
/// Synchronous execution of binaries with a deadline.
///
/// The executor runs a binary in its own process group, captures its stdout
/// and stderr and forcibly terminates the whole group if it does not finish
/// within the given timeout.  The returned exit_handle describes what
/// happened.
///
/// This module is thread-safe: different threads may run different binaries
/// concurrently.

#if !defined(UTILS_PROCESS_EXECUTOR_HPP)
#define UTILS_PROCESS_EXECUTOR_HPP

#include <string>

#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.hpp"
#include "utils/process/operations.hpp"
#include "utils/process/status.hpp"

namespace utils {
namespace process {
namespace executor {


/// Container for the results of an executed subprocess.
class exit_handle {
    /// Termination status, or none if the deadline expired.
    optional< process::status > _status;

    /// Multiplexed stdout and stderr of the subprocess.
    std::string _output;

    /// Time when the subprocess was started.
    datetime::timestamp _start_time;

    /// Time when the subprocess was reaped.
    datetime::timestamp _end_time;

public:
    exit_handle(const optional< process::status >&, const std::string&,
                const datetime::timestamp&, const datetime::timestamp&);

    const optional< process::status >& status(void) const;
    bool timed_out(void) const;
    const std::string& output(void) const;
    const datetime::timestamp& start_time(void) const;
    const datetime::timestamp& end_time(void) const;
};


exit_handle run(const fs::path&, const args_vector&, const datetime::delta&,
                const optional< fs::path >& = optional< fs::path >());


}  // namespace executor
}  // namespace process
}  // namespace utils

#endif  // !defined(UTILS_PROCESS_EXECUTOR_HPP)
