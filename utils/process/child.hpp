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

/// \file utils/process/child.hpp
/// Spawning and manipulation of children processes.
///
/// The child class provides a mechanism to spawn a binary in a subprocess and
/// to capture its stdout and stderr, multiplexed, through a pipe.  The child
/// is placed in its own process group so that it and any processes it starts
/// can be terminated together.

#if !defined(UTILS_PROCESS_CHILD_HPP)
#define UTILS_PROCESS_CHILD_HPP

#include <memory>
#include <string>

#include "utils/fs/path.hpp"
#include "utils/noncopyable.hpp"
#include "utils/optional.hpp"
#include "utils/process/operations.hpp"
#include "utils/process/status.hpp"

namespace utils {
namespace process {


/// Child process spawner and controller.
class child : noncopyable {
    struct impl;

    /// Pointer to the shared internal implementation.
    std::unique_ptr< impl > _pimpl;

    explicit child(impl*);

public:
    ~child(void);

    static std::unique_ptr< child > fork_capture(
        const fs::path&, const args_vector&,
        const optional< fs::path >& = optional< fs::path >());

    int pid(void) const;
    std::string read_output(void);

    status wait(void);
};


}  // namespace process
}  // namespace utils

#endif  // !defined(UTILS_PROCESS_CHILD_HPP)
