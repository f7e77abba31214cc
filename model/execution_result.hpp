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

/// \file model/execution_result.hpp
/// Definition of the execution_result class.
///
/// An execution result is the only artifact returned to the callers of the
/// engine: every request, no matter how it fails, yields one of these.

#if !defined(MODEL_EXECUTION_RESULT_HPP)
#define MODEL_EXECUTION_RESULT_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "model/test_result.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.hpp"

namespace model {


/// Overall outcome of an execution.
enum execution_status {
    status_success,
    status_error,
    status_timeout,
};


/// Classification of request-level faults.
enum fault_kind {
    fault_validation,
    fault_safety,
    fault_environment,
    fault_timeout,
    fault_protocol,
};


/// Aggregate outcome of running a request.
class execution_result {
    /// Overall outcome.
    execution_status _status;

    /// Classification of the fault that aborted the request, if any.
    utils::optional< fault_kind > _fault;

    /// Per-test results in test case order.
    test_results_vector _test_results;

    /// Total time spent in the test cases.
    utils::datetime::delta _elapsed;

    /// Top-level error message.
    utils::optional< std::string > _message;

    /// Trace of the error that aborted the request.
    utils::optional< std::string > _traceback;

    /// Unprocessed output of the execution environment.
    utils::optional< std::string > _raw_output;

    /// Notes for the caller about the way the request was handled.
    std::vector< std::string > _warnings;

    /// Name of the backend that produced the result.
    std::string _backend;

    execution_result(const execution_status, const utils::optional< fault_kind >&,
                     const test_results_vector&, const utils::datetime::delta&,
                     const utils::optional< std::string >&);

public:
    static execution_result make_success(const test_results_vector&,
                                         const utils::datetime::delta&);
    static execution_result make_error(const std::string&);
    static execution_result make_error(
        const fault_kind, const std::string&,
        const utils::datetime::delta& = utils::datetime::delta());
    static execution_result make_timeout(const std::string&,
                                         const utils::datetime::delta&);

    execution_status status(void) const;
    const utils::optional< fault_kind >& fault(void) const;
    const test_results_vector& test_results(void) const;
    const utils::datetime::delta& elapsed(void) const;
    const utils::optional< std::string >& message(void) const;
    const utils::optional< std::string >& traceback(void) const;
    const utils::optional< std::string >& raw_output(void) const;
    const std::vector< std::string >& warnings(void) const;
    const std::string& backend(void) const;

    std::size_t passed(void) const;
    std::size_t failed(void) const;
    bool all_passed(void) const;
    utils::datetime::delta average_time(void) const;
    utils::datetime::delta max_time(void) const;
    double success_rate(void) const;

    void add_warning(const std::string&);
    void set_backend(const std::string&);
    void set_raw_output(const std::string&);
    void set_traceback(const std::string&);

    bool operator==(const execution_result&) const;
    bool operator!=(const execution_result&) const;
};


const char* status_name(const execution_status);
const char* fault_name(const fault_kind);


std::ostream& operator<<(std::ostream&, const execution_status);
std::ostream& operator<<(std::ostream&, const fault_kind);
std::ostream& operator<<(std::ostream&, const execution_result&);


}  // namespace model

#endif  // !defined(MODEL_EXECUTION_RESULT_HPP)
