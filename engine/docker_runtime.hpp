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

/// \file engine/docker_runtime.hpp
/// Container runtime backed by the docker command line client.

#if !defined(ENGINE_DOCKER_RUNTIME_HPP)
#define ENGINE_DOCKER_RUNTIME_HPP

#include <string>

#include "engine/container_runtime.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.hpp"
#include "utils/process/executor.hpp"
#include "utils/process/operations.hpp"

namespace engine {


namespace detail {


extern const int default_pids_limit;

utils::process::args_vector create_args(const container_spec&, const int);


}  // namespace detail


/// Implementation of container_runtime that spawns the docker client.
///
/// Every invocation of the client is bounded by a command timeout so that a
/// hung daemon cannot block the caller forever.  The only exception is
/// wait(), which is bounded by the timeout given by the caller.
class docker_runtime : public container_runtime {
    /// Name or path of the docker client as given by the user.
    std::string _program_name;

    /// Resolved path to the docker client, if it could be found.
    utils::optional< utils::fs::path > _program;

    /// Deadline for the client commands that should complete promptly.
    utils::datetime::delta _command_timeout;

    /// Maximum number of processes within a container.
    int _pids_limit;

    utils::process::executor::exit_handle run_client(
        const utils::process::args_vector&,
        const utils::datetime::delta&) const;
    std::string run_checked(const utils::process::args_vector&) const;

public:
    docker_runtime(const std::string&, const utils::datetime::delta&,
                   const int = detail::default_pids_limit);

    std::string version(void);
    void create(const container_spec&);
    void start(const std::string&);
    utils::optional< int > wait(const std::string&,
                                const utils::datetime::delta&);
    void stop(const std::string&);
    std::string logs(const std::string&);
    void remove(const std::string&);
};


}  // namespace engine

#endif  // !defined(ENGINE_DOCKER_RUNTIME_HPP)
