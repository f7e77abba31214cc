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

/// \file engine/backend.hpp
/// Interface to the mechanisms that run requests.
///
/// Two implementations exist: engine::sandbox runs the code in containers
/// and engine::host_executor runs it directly on the host as a degraded
/// fallback.  setup_backend() selects one of them at startup.

#if !defined(ENGINE_BACKEND_HPP)
#define ENGINE_BACKEND_HPP

#include <memory>

#include "engine/config.hpp"
#include "engine/container_runtime.hpp"
#include "model/execution_request.hpp"
#include "model/execution_result.hpp"
#include "model/language.hpp"
#include "model/program.hpp"

namespace engine {


/// Abstract interface of an execution backend.
///
/// Implementations must allow concurrent calls to execute() and
/// run_program().
class backend {
public:
    virtual ~backend(void);

    /// Returns the name of the backend, for reporting purposes.
    virtual const char* name(void) const = 0;

    /// Checks if the backend can run code of a given language.
    virtual bool supports(const model::language) const = 0;

    /// Runs a request.
    ///
    /// \param request The request to run.
    ///
    /// \return The result of the execution.  Request-level faults are
    /// reported as error results and never raised.
    virtual model::execution_result execute(
        const model::execution_request& request) = 0;

    /// Runs a program once, feeding it its input through stdin.
    ///
    /// \param request The program to run.
    ///
    /// \return The outcome of the program.  Faults are reported as error
    /// results and never raised.
    virtual model::program_result run_program(
        const model::program_request& request) = 0;

    /// Releases any resources that outlived the requests that created them.
    virtual void cleanup(void) = 0;
};


std::shared_ptr< backend > setup_backend(
    const config&, const std::shared_ptr< container_runtime >&);


}  // namespace engine

#endif  // !defined(ENGINE_BACKEND_HPP)
