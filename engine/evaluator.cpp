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

#include "engine/evaluator.hpp"

#include <stdexcept>

#include "engine/safety.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"

using utils::none;
using utils::optional;


namespace {


/// Reason for which a piece of code is not handed to the backend.
struct rejection {
    /// Classification of the problem.
    model::fault_kind fault;

    /// Description of the problem.
    std::string message;

    /// Constructor.
    ///
    /// \param fault_ Classification of the problem.
    /// \param message_ Description of the problem.
    rejection(const model::fault_kind fault_, const std::string& message_) :
        fault(fault_), message(message_)
    {
    }
};


/// Checks whether a backend may run a piece of code.
///
/// \param backend The backend that would run the code.
/// \param safety_check Whether to pre-screen Python code.
/// \param language The language of the code.
/// \param code The code to check.
///
/// \return The reason to reject the code, or none if it can run.
static optional< rejection >
screen(const engine::backend& backend, const bool safety_check,
       const model::language language, const std::string& code)
{
    if (!backend.supports(language))
        return utils::make_optional(rejection(
            model::fault_validation,
            F("The %s backend cannot run %s code") % backend.name() %
            model::language_name(language)));

    if (!safety_check) {
        LD("Safety check disabled");
    } else if (language != model::language_python) {
        LD(F("Skipping safety check for %s code") %
           model::language_name(language));
    } else {
        const engine::safety_verdict verdict = engine::check_code(code);
        if (!verdict.is_safe) {
            LI(F("Rejected code: %s") % verdict.message);
            return utils::make_optional(rejection(model::fault_safety,
                                                  verdict.message));
        }
    }
    return none;
}


/// Runs a request through the pre-screener and the backend.
///
/// \param backend The backend to run the request on.
/// \param safety_check Whether to pre-screen Python code.
/// \param request The request to run.
///
/// \return The result of the request.
///
/// \throw std::exception If any unexpected fault happens.
static model::execution_result
safe_evaluate(engine::backend& backend, const bool safety_check,
              const model::execution_request& request)
{
    const optional< rejection > rejected = screen(
        backend, safety_check, request.language(), request.code());
    if (rejected)
        return model::execution_result::make_error(rejected.get().fault,
                                                   rejected.get().message);

    LI(F("Executing %s code with %s test cases on the %s backend") %
       model::language_name(request.language()) %
       request.test_cases().size() % backend.name());
    return backend.execute(request);
}


/// Runs a program through the pre-screener and the backend.
///
/// \param backend The backend to run the program on.
/// \param safety_check Whether to pre-screen Python code.
/// \param request The program to run.
///
/// \return The outcome of the program.
///
/// \throw std::exception If any unexpected fault happens.
static model::program_result
safe_run_program(engine::backend& backend, const bool safety_check,
                 const model::program_request& request)
{
    const optional< rejection > rejected = screen(
        backend, safety_check, request.language(), request.code());
    if (rejected)
        return model::program_result::make_error(rejected.get().fault,
                                                 rejected.get().message);

    LI(F("Running %s program with %s bytes of input on the %s backend") %
       model::language_name(request.language()) % request.input().length() %
       backend.name());
    return backend.run_program(request);
}


/// Tags a result with the backend that produced it.
///
/// \param backend The backend that ran the request.
/// \param result The result of the request.
///
/// \return The tagged result.
static model::execution_result
finish(const engine::backend& backend, model::execution_result result)
{
    result.set_backend(backend.name());
    LI(F("Request finished with status %s: %s passed, %s failed") %
       result.status() % result.passed() % result.failed());
    return result;
}


}  // anonymous namespace


/// Constructor.
///
/// \param backend_ Backend to run the requests on.
/// \param safety_check_ Whether to pre-screen Python code.
engine::evaluator::evaluator(const std::shared_ptr< backend >& backend_,
                             const bool safety_check_) :
    _backend(backend_),
    _safety_check(safety_check_)
{
}


/// Evaluates a request.
///
/// \param request The request to evaluate.
///
/// \return The result of the request, tagged with the name of the backend.
/// Faults are reported as error results.
model::execution_result
engine::evaluator::evaluate(const model::execution_request& request) const
{
    try {
        return finish(*_backend, safe_evaluate(*_backend, _safety_check,
                                               request));
    } catch (const std::exception& e) {
        LE(F("Unexpected failure while running request: %s") % e.what());
        return finish(*_backend, model::execution_result::make_error(
            model::fault_environment, F("Execution error: %s") % e.what()));
    }
}


/// Runs a program with a given standard input.
///
/// \param request The program to run.
///
/// \return The outcome of the program, tagged with the name of the backend.
/// Faults are reported as error results.
model::program_result
engine::evaluator::run_program(const model::program_request& request) const
{
    model::program_result result = model::program_result::make_error(
        model::fault_environment, "Program did not run");
    try {
        result = safe_run_program(*_backend, _safety_check, request);
    } catch (const std::exception& e) {
        LE(F("Unexpected failure while running program: %s") % e.what());
        result = model::program_result::make_error(
            model::fault_environment, F("Execution error: %s") % e.what());
    }
    result.set_backend(_backend->name());
    LI(F("Program finished with status %s") % result.status());
    return result;
}


/// Releases the resources held by the backend.
void
engine::evaluator::cleanup(void)
{
    _backend->cleanup();
}
