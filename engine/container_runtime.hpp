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

/// \file engine/container_runtime.hpp
/// Abstract interface to the runtime that hosts isolated environments.
///
/// The sandbox talks to containers exclusively through this interface so that
/// the Docker client can be replaced by a test double.  Containers are
/// identified by the name given to them at creation time.

#if !defined(ENGINE_CONTAINER_RUNTIME_HPP)
#define ENGINE_CONTAINER_RUNTIME_HPP

#include <string>

#include "model/resource_limits.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.hpp"
#include "utils/process/operations.hpp"

namespace engine {


/// Parameters of a container to be created.
struct container_spec {
    /// Unique name of the container.
    std::string name;

    /// Image the container runs.
    std::string image;

    /// Host directory mounted as the working directory of the container.
    utils::fs::path workspace;

    /// Command to run as the entry command of the container.
    utils::process::args_vector command;

    /// Memory, CPU and network constraints.
    model::resource_limits limits;

    container_spec(const std::string&, const std::string&,
                   const utils::fs::path&,
                   const utils::process::args_vector&,
                   const model::resource_limits&);
};


/// Abstract interface to a container runtime.
///
/// All methods raise engine::container_error (or a subclass) on failure.
class container_runtime {
public:
    virtual ~container_runtime(void);

    /// Queries the version of the runtime.
    ///
    /// \return A version string, as reported by the runtime.
    virtual std::string version(void) = 0;

    /// Creates a container without starting it.
    ///
    /// \param spec Parameters of the container.
    ///
    /// \throw engine::image_not_found_error If the image is not available.
    virtual void create(const container_spec& spec) = 0;

    /// Starts a previously-created container in the background.
    ///
    /// \param name Name of the container.
    virtual void start(const std::string& name) = 0;

    /// Waits for a running container to terminate.
    ///
    /// \param name Name of the container.
    /// \param timeout Maximum time to wait for.
    ///
    /// \return The exit code of the entry command, or none if the deadline
    /// expired before the container terminated.
    virtual utils::optional< int > wait(
        const std::string& name, const utils::datetime::delta& timeout) = 0;

    /// Forcibly stops a running container.
    ///
    /// \param name Name of the container.
    virtual void stop(const std::string& name) = 0;

    /// Fetches the combined stdout and stderr of a container.
    ///
    /// \param name Name of the container.
    ///
    /// \return The output of the container so far.
    virtual std::string logs(const std::string& name) = 0;

    /// Destroys a container, stopping it first if necessary.
    ///
    /// \param name Name of the container.
    virtual void remove(const std::string& name) = 0;
};


std::string check_requirements(container_runtime&);


}  // namespace engine

#endif  // !defined(ENGINE_CONTAINER_RUNTIME_HPP)
