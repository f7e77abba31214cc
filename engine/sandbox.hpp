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

/// \file engine/sandbox.hpp
/// Execution of requests within isolated containers.

#if !defined(ENGINE_SANDBOX_HPP)
#define ENGINE_SANDBOX_HPP

#include <cstddef>
#include <memory>

#include "engine/backend.hpp"
#include "engine/config.hpp"
#include "engine/container_runtime.hpp"

namespace engine {


/// Backend that runs each request in a container of its own.
///
/// Every request gets a fresh workspace and a fresh container.  Both are
/// destroyed once the results have been collected, regardless of the outcome
/// of the execution.
class sandbox : public backend {
    struct impl;

    /// Pointer to the shared internal implementation.
    std::shared_ptr< impl > _pimpl;

public:
    sandbox(const std::shared_ptr< container_runtime >&, const config&);
    ~sandbox(void);

    const char* name(void) const;
    bool supports(const model::language) const;
    model::execution_result execute(const model::execution_request&);
    model::program_result run_program(const model::program_request&);
    void cleanup(void);

    std::size_t live_containers(void) const;
};


}  // namespace engine

#endif  // !defined(ENGINE_SANDBOX_HPP)
