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

/// \file engine/host_executor.hpp
/// Execution of requests directly on the host.
///
/// This backend exists for continuity when no container runtime is
/// reachable.  It provides no memory or network isolation: the only
/// protection is a per-test deadline after which the interpreter and all of
/// its children are killed.

#if !defined(ENGINE_HOST_EXECUTOR_HPP)
#define ENGINE_HOST_EXECUTOR_HPP

#include <memory>

#include "engine/backend.hpp"
#include "engine/config.hpp"

namespace engine {


extern const char* const degraded_warning;


void isolate_environment(void);


/// Backend that runs each test case in a host interpreter process.
class host_executor : public backend {
    struct impl;

    /// Pointer to the shared internal implementation.
    std::shared_ptr< impl > _pimpl;

public:
    explicit host_executor(const config&);
    ~host_executor(void);

    const char* name(void) const;
    bool supports(const model::language) const;
    model::execution_result execute(const model::execution_request&);
    model::program_result run_program(const model::program_request&);
    void cleanup(void);
};


}  // namespace engine

#endif  // !defined(ENGINE_HOST_EXECUTOR_HPP)
