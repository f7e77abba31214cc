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

#include "model/execution_result.hpp"

#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;

using utils::none;
using utils::optional;


/// Constructs a new execution result.
///
/// \param status_ Overall outcome.
/// \param fault_ Classification of the fault, if any.
/// \param test_results_ Per-test results in test case order.
/// \param elapsed_ Total time spent in the test cases.
/// \param message_ Top-level error message.
model::execution_result::execution_result(
    const execution_status status_,
    const optional< fault_kind >& fault_,
    const test_results_vector& test_results_,
    const datetime::delta& elapsed_,
    const optional< std::string >& message_) :
    _status(status_),
    _fault(fault_),
    _test_results(test_results_),
    _elapsed(elapsed_),
    _message(message_)
{
}


/// Constructs a result for a request whose tests could all be run.
///
/// \param test_results Per-test results in test case order.
/// \param elapsed Total time spent in the test cases.
///
/// \return A new execution result.
model::execution_result
model::execution_result::make_success(const test_results_vector& test_results,
                                      const datetime::delta& elapsed)
{
    return execution_result(status_success, none, test_results, elapsed,
                            none);
}


/// Constructs a result for an error reported by the candidate's own run.
///
/// These are errors like a missing function or code that does not load,
/// which do not denote a fault of the engine.
///
/// \param message Description of the problem.
///
/// \return A new execution result.
model::execution_result
model::execution_result::make_error(const std::string& message)
{
    return execution_result(status_error, none, test_results_vector(),
                            datetime::delta(), utils::make_optional(message));
}


/// Constructs a result for a request that could not be completed.
///
/// \param fault Classification of the problem.
/// \param message Description of the problem.
/// \param elapsed Time spent before the problem was detected.
///
/// \return A new execution result.
model::execution_result
model::execution_result::make_error(const fault_kind fault,
                                    const std::string& message,
                                    const datetime::delta& elapsed)
{
    return execution_result(status_error, utils::make_optional(fault),
                            test_results_vector(), elapsed,
                            utils::make_optional(message));
}


/// Constructs a result for a request that exceeded its deadline.
///
/// \param message Description of the problem.
/// \param elapsed The deadline that was exceeded.
///
/// \return A new execution result.
model::execution_result
model::execution_result::make_timeout(const std::string& message,
                                      const datetime::delta& elapsed)
{
    return execution_result(status_timeout,
                            utils::make_optional(fault_timeout),
                            test_results_vector(), elapsed,
                            utils::make_optional(message));
}


/// \return The overall outcome.
model::execution_status
model::execution_result::status(void) const
{
    return _status;
}


/// \return The classification of the fault that aborted the request.
const optional< model::fault_kind >&
model::execution_result::fault(void) const
{
    return _fault;
}


/// \return The per-test results in test case order.
const model::test_results_vector&
model::execution_result::test_results(void) const
{
    return _test_results;
}


/// \return The total time spent in the test cases.
const datetime::delta&
model::execution_result::elapsed(void) const
{
    return _elapsed;
}


/// \return The top-level error message, if any.
const optional< std::string >&
model::execution_result::message(void) const
{
    return _message;
}


/// \return The trace of the error that aborted the request, if any.
const optional< std::string >&
model::execution_result::traceback(void) const
{
    return _traceback;
}


/// \return The unprocessed output of the execution environment, if kept.
const optional< std::string >&
model::execution_result::raw_output(void) const
{
    return _raw_output;
}


/// \return The notes about the way the request was handled.
const std::vector< std::string >&
model::execution_result::warnings(void) const
{
    return _warnings;
}


/// \return The name of the backend that produced the result; may be empty.
const std::string&
model::execution_result::backend(void) const
{
    return _backend;
}


/// Counts the test cases that passed.
///
/// \return A count.
std::size_t
model::execution_result::passed(void) const
{
    std::size_t count = 0;
    for (test_results_vector::const_iterator iter = _test_results.begin();
         iter != _test_results.end(); ++iter) {
        if ((*iter).passed())
            ++count;
    }
    return count;
}


/// Counts the test cases that failed.
///
/// \return A count.
std::size_t
model::execution_result::failed(void) const
{
    return _test_results.size() - passed();
}


/// Checks whether the request succeeded and all of its tests passed.
///
/// \return True if there is nothing to complain about.
bool
model::execution_result::all_passed(void) const
{
    return _status == status_success && failed() == 0;
}


/// Computes the average time taken by a test case.
///
/// \return The average, or zero if there are no test results.
datetime::delta
model::execution_result::average_time(void) const
{
    if (_test_results.empty())
        return datetime::delta();

    int64_t total = 0;
    for (test_results_vector::const_iterator iter = _test_results.begin();
         iter != _test_results.end(); ++iter)
        total += (*iter).elapsed().to_microseconds();
    return datetime::delta::from_microseconds(
        total / static_cast< int64_t >(_test_results.size()));
}


/// Computes the time taken by the slowest test case.
///
/// \return The maximum, or zero if there are no test results.
datetime::delta
model::execution_result::max_time(void) const
{
    datetime::delta max;
    for (test_results_vector::const_iterator iter = _test_results.begin();
         iter != _test_results.end(); ++iter) {
        if ((*iter).elapsed() > max)
            max = (*iter).elapsed();
    }
    return max;
}


/// Computes the ratio of passed test cases.
///
/// \return A number between 0 and 1; 0 if there are no test results.
double
model::execution_result::success_rate(void) const
{
    if (_test_results.empty())
        return 0.0;
    return static_cast< double >(passed()) / _test_results.size();
}


/// Attaches a note for the caller.
///
/// \param warning The text of the note.
void
model::execution_result::add_warning(const std::string& warning)
{
    _warnings.push_back(warning);
}


/// Records the backend that produced the result.
///
/// \param backend_ Name of the backend.
void
model::execution_result::set_backend(const std::string& backend_)
{
    _backend = backend_;
}


/// Attaches the unprocessed output of the execution environment.
///
/// \param raw_output_ The output.
void
model::execution_result::set_raw_output(const std::string& raw_output_)
{
    _raw_output = raw_output_;
}


/// Attaches the trace of the error that aborted the request.
///
/// \param traceback_ The trace.
void
model::execution_result::set_traceback(const std::string& traceback_)
{
    PRE(_status != status_success);
    _traceback = traceback_;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::execution_result::operator==(const execution_result& other) const
{
    return (_status == other._status &&
            _fault == other._fault &&
            _test_results == other._test_results &&
            _elapsed == other._elapsed &&
            _message == other._message &&
            _traceback == other._traceback &&
            _raw_output == other._raw_output &&
            _warnings == other._warnings &&
            _backend == other._backend);
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::execution_result::operator!=(const execution_result& other) const
{
    return !(*this == other);
}


/// Returns the textual representation of a status.
///
/// \param status The status to name.
///
/// \return The name used in the JSON representation.
const char*
model::status_name(const execution_status status)
{
    switch (status) {
    case status_success: return "success";
    case status_error: return "error";
    case status_timeout: return "timeout";
    }
    UNREACHABLE;
}


/// Returns the textual representation of a fault kind.
///
/// \param fault The fault kind to name.
///
/// \return The name used in the JSON representation.
const char*
model::fault_name(const fault_kind fault)
{
    switch (fault) {
    case fault_validation: return "validation";
    case fault_safety: return "safety";
    case fault_environment: return "environment";
    case fault_timeout: return "timeout";
    case fault_protocol: return "protocol";
    }
    UNREACHABLE;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param status The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const execution_status status)
{
    output << status_name(status);
    return output;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param fault The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const fault_kind fault)
{
    output << fault_name(fault);
    return output;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const execution_result& object)
{
    output << F("execution_result{status=%s, fault=%s, passed=%s, "
                "failed=%s, elapsed=%s, message=%s}")
        % object.status() % object.fault() % object.passed()
        % object.failed() % object.elapsed() % object.message();
    return output;
}
