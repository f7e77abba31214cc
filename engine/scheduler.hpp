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

/// \file engine/scheduler.hpp
/// Concurrent evaluation of requests.
///
/// The scheduler owns a fixed pool of worker threads.  Requests are queued
/// and picked up by the first idle worker, so a request that blocks on a slow
/// container never delays the submission of other requests.  Test cases
/// within a request keep running in order within a single worker.

#if !defined(ENGINE_SCHEDULER_HPP)
#define ENGINE_SCHEDULER_HPP

#include <future>
#include <memory>

#include "engine/evaluator.hpp"
#include "model/execution_request.hpp"
#include "model/execution_result.hpp"
#include "utils/noncopyable.hpp"

namespace engine {


/// Pool of workers that evaluate requests.
class scheduler : utils::noncopyable {
    struct impl;

    /// Pointer to the internal implementation.
    std::unique_ptr< impl > _pimpl;

public:
    scheduler(const evaluator&, const int);
    ~scheduler(void);

    std::future< model::execution_result > submit(
        const model::execution_request&);
    void cleanup(void);
};


}  // namespace engine

#endif  // !defined(ENGINE_SCHEDULER_HPP)
