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

/// \file engine/evaluator.hpp
/// Entry point to the evaluation of requests.
///
/// The evaluator chains the pre-screening of the code with its execution on
/// the selected backend and guarantees that every request gets an answer:
/// request-level faults are reported as error results, never raised.

#if !defined(ENGINE_EVALUATOR_HPP)
#define ENGINE_EVALUATOR_HPP

#include <memory>

#include "engine/backend.hpp"
#include "model/execution_request.hpp"
#include "model/execution_result.hpp"
#include "model/program.hpp"

namespace engine {


/// Validates, screens and runs requests.
class evaluator {
    /// Backend to run the requests on.
    std::shared_ptr< backend > _backend;

    /// Whether to pre-screen Python code.
    bool _safety_check;

public:
    evaluator(const std::shared_ptr< backend >&, const bool);

    model::execution_result evaluate(const model::execution_request&) const;
    model::program_result run_program(const model::program_request&) const;
    void cleanup(void);
};


}  // namespace engine

#endif  // !defined(ENGINE_EVALUATOR_HPP)
