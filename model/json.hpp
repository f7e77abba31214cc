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

/// \file model/json.hpp
/// Conversion of the model objects to and from JSON documents.
///
/// The field names match the ones used by the harness payload so that the
/// same document format flows from the execution environment to the callers.

#if !defined(MODEL_JSON_HPP)
#define MODEL_JSON_HPP

#include <vector>

#include <nlohmann/json.hpp>

#include "model/execution_request.hpp"
#include "model/execution_result.hpp"
#include "model/program.hpp"
#include "model/resource_limits.hpp"
#include "model/test_case.hpp"
#include "model/test_result.hpp"

namespace model {


nlohmann::json test_case_to_json(const test_case&);
test_case test_case_from_json(const nlohmann::json&);
nlohmann::json test_cases_to_json(const test_cases_vector&);
test_cases_vector test_cases_from_json(const nlohmann::json&);

execution_request request_from_json(const nlohmann::json&,
                                    const resource_limits&);
std::vector< execution_request > requests_from_json(const nlohmann::json&,
                                                    const resource_limits&);

nlohmann::json test_result_to_json(const test_result&);
test_result test_result_from_json(const nlohmann::json&, const test_case&);

nlohmann::json result_to_json(const execution_result&);

program_request program_request_from_json(const nlohmann::json&,
                                          const resource_limits&);
nlohmann::json program_result_to_json(const program_result&);


}  // namespace model

#endif  // !defined(MODEL_JSON_HPP)
