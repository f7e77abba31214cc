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

#include "model/program.hpp"

#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/text/operations.hpp"

namespace datetime = utils::datetime;
namespace text = utils::text;

using utils::none;
using utils::optional;


/// Constructs a new program request.
///
/// \param language_ Language of the code.
/// \param code_ Source code of the program.
/// \param input_ Text fed to the standard input of the program.
/// \param limits_ Resources granted to the execution.
model::program_request::program_request(const model::language language_,
                                        const std::string& code_,
                                        const std::string& input_,
                                        const resource_limits& limits_) :
    _language(language_),
    _code(code_),
    _input(input_),
    _limits(limits_)
{
}


/// \return The language of the code.
model::language
model::program_request::language(void) const
{
    return _language;
}


/// \return The source code of the program.
const std::string&
model::program_request::code(void) const
{
    return _code;
}


/// \return The text fed to the standard input of the program.
const std::string&
model::program_request::input(void) const
{
    return _input;
}


/// \return The resources granted to the execution.
const model::resource_limits&
model::program_request::limits(void) const
{
    return _limits;
}


/// Creates a copy of the request with different resource limits.
///
/// \param limits_ The new resource limits.
///
/// \return A new request; this one is left untouched.
model::program_request
model::program_request::with_limits(const resource_limits& limits_) const
{
    return program_request(_language, _code, _input, limits_);
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::program_request::operator==(const program_request& other) const
{
    return (_language == other._language && _code == other._code &&
            _input == other._input && _limits == other._limits);
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::program_request::operator!=(const program_request& other) const
{
    return !(*this == other);
}


/// Constructor.
///
/// \param status_ Overall outcome.
/// \param fault_ Classification of the fault, if any.
/// \param output_text_ Standard output of the program.
/// \param error_text_ Standard error of the program.
/// \param exit_code_ Exit code of the program, if it terminated on its own.
/// \param elapsed_ Time the program ran for.
/// \param message_ Top-level error message.
model::program_result::program_result(
    const execution_status status_,
    const optional< fault_kind >& fault_,
    const std::string& output_text_,
    const std::string& error_text_,
    const optional< int >& exit_code_,
    const datetime::delta& elapsed_,
    const optional< std::string >& message_) :
    _status(status_),
    _fault(fault_),
    _output_text(output_text_),
    _error_text(error_text_),
    _exit_code(exit_code_),
    _elapsed(elapsed_),
    _message(message_)
{
}


/// Constructs the result of a program that terminated on its own.
///
/// A program that printed anything to its standard error or that exited
/// with a non-zero code is considered to have failed.
///
/// \param output_text Standard output of the program.
/// \param error_text Standard error of the program.
/// \param exit_code Exit code of the program.
/// \param elapsed Time the program ran for.
///
/// \return A success or an error result.
model::program_result
model::program_result::make_completed(const std::string& output_text,
                                      const std::string& error_text,
                                      const int exit_code,
                                      const datetime::delta& elapsed)
{
    const std::string output = text::trim(output_text);
    const std::string error = text::trim(error_text);

    optional< std::string > message;
    if (!error.empty())
        message = "Runtime error";
    else if (exit_code != 0)
        message = std::string(F("Program exited with code %s") % exit_code);

    return program_result(message ? status_error : status_success, none,
                          output, error, utils::make_optional(exit_code),
                          elapsed, message);
}


/// Constructs the result of a program that could not be run.
///
/// \param fault Classification of the problem.
/// \param message Description of the problem.
///
/// \return An error result.
model::program_result
model::program_result::make_error(const fault_kind fault,
                                  const std::string& message)
{
    return program_result(status_error, utils::make_optional(fault), "", "",
                          none, datetime::delta(),
                          utils::make_optional(message));
}


/// Constructs the result of a program that exceeded its deadline.
///
/// \param message Description of the problem.
/// \param elapsed The deadline that expired.
///
/// \return A timeout result.
model::program_result
model::program_result::make_timeout(const std::string& message,
                                    const datetime::delta& elapsed)
{
    return program_result(status_timeout, utils::make_optional(fault_timeout),
                          "", "", none, elapsed,
                          utils::make_optional(message));
}


/// \return The overall outcome.
model::execution_status
model::program_result::status(void) const
{
    return _status;
}


/// \return The classification of the fault that prevented the run, if any.
const optional< model::fault_kind >&
model::program_result::fault(void) const
{
    return _fault;
}


/// \return What the program printed to its standard output.
const std::string&
model::program_result::output_text(void) const
{
    return _output_text;
}


/// \return What the program printed to its standard error.
const std::string&
model::program_result::error_text(void) const
{
    return _error_text;
}


/// \return The exit code of the program, if it terminated on its own.
const optional< int >&
model::program_result::exit_code(void) const
{
    return _exit_code;
}


/// \return The time the program ran for.
const datetime::delta&
model::program_result::elapsed(void) const
{
    return _elapsed;
}


/// \return The top-level error message, if any.
const optional< std::string >&
model::program_result::message(void) const
{
    return _message;
}


/// \return The unprocessed output of the execution environment, if kept.
const optional< std::string >&
model::program_result::raw_output(void) const
{
    return _raw_output;
}


/// \return The notes about the way the program was handled.
const std::vector< std::string >&
model::program_result::warnings(void) const
{
    return _warnings;
}


/// \return The name of the backend that produced the result.
const std::string&
model::program_result::backend(void) const
{
    return _backend;
}


/// Attaches a note for the caller.
///
/// \param warning The note to attach.
void
model::program_result::add_warning(const std::string& warning)
{
    _warnings.push_back(warning);
}


/// Records the backend that produced the result.
///
/// \param backend_ The name of the backend.
void
model::program_result::set_backend(const std::string& backend_)
{
    _backend = backend_;
}


/// Attaches the unprocessed output of the execution environment.
///
/// \param raw_output_ The output.
void
model::program_result::set_raw_output(const std::string& raw_output_)
{
    _raw_output = raw_output_;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::program_result::operator==(const program_result& other) const
{
    return (_status == other._status && _fault == other._fault &&
            _output_text == other._output_text &&
            _error_text == other._error_text &&
            _exit_code == other._exit_code && _elapsed == other._elapsed &&
            _message == other._message && _raw_output == other._raw_output &&
            _warnings == other._warnings && _backend == other._backend);
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::program_result::operator!=(const program_result& other) const
{
    return !(*this == other);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const program_request& object)
{
    output << F("program_request{language=%s, code=%s, input=%s, limits=%s}")
        % object.language() % text::quote(object.code(), '\'')
        % text::quote(object.input(), '\'') % object.limits();
    return output;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const program_result& object)
{
    output << F("program_result{status=%s, fault=%s, exit_code=%s, "
                "elapsed=%s, message=%s}")
        % object.status() % object.fault() % object.exit_code()
        % object.elapsed() % object.message();
    return output;
}
