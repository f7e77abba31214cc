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

/// \file model/program.hpp
/// Definition of the program_request and program_result classes.
///
/// A program run feeds a fixed text to the standard input of the candidate
/// code and collects what the code prints.  There are no test cases and no
/// entry point: the code runs as a whole, once.

#if !defined(MODEL_PROGRAM_HPP)
#define MODEL_PROGRAM_HPP

#include <ostream>
#include <string>
#include <vector>

#include "model/execution_result.hpp"
#include "model/language.hpp"
#include "model/resource_limits.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.hpp"

namespace model {


/// Representation of a program to run once with a given standard input.
class program_request {
    /// Language of the code.
    model::language _language;

    /// Source code of the program.
    std::string _code;

    /// Text fed to the standard input of the program.
    std::string _input;

    /// Resources granted to the execution.
    resource_limits _limits;

public:
    program_request(const model::language, const std::string&,
                    const std::string& = "",
                    const resource_limits& = resource_limits());

    model::language language(void) const;
    const std::string& code(void) const;
    const std::string& input(void) const;
    const resource_limits& limits(void) const;

    program_request with_limits(const resource_limits&) const;

    bool operator==(const program_request&) const;
    bool operator!=(const program_request&) const;
};


/// Outcome of running a program.
class program_result {
    /// Overall outcome.
    execution_status _status;

    /// Classification of the fault that prevented the run, if any.
    utils::optional< fault_kind > _fault;

    /// What the program printed to its standard output, trimmed.
    std::string _output_text;

    /// What the program printed to its standard error, trimmed.
    std::string _error_text;

    /// Exit code of the program, if it terminated on its own.
    utils::optional< int > _exit_code;

    /// Time the program ran for.
    utils::datetime::delta _elapsed;

    /// Top-level error message.
    utils::optional< std::string > _message;

    /// Unprocessed output of the execution environment.
    utils::optional< std::string > _raw_output;

    /// Notes for the caller about the way the program was handled.
    std::vector< std::string > _warnings;

    /// Name of the backend that produced the result.
    std::string _backend;

    program_result(const execution_status,
                   const utils::optional< fault_kind >&, const std::string&,
                   const std::string&, const utils::optional< int >&,
                   const utils::datetime::delta&,
                   const utils::optional< std::string >&);

public:
    static program_result make_completed(const std::string&,
                                         const std::string&, const int,
                                         const utils::datetime::delta&);
    static program_result make_error(const fault_kind, const std::string&);
    static program_result make_timeout(const std::string&,
                                       const utils::datetime::delta&);

    execution_status status(void) const;
    const utils::optional< fault_kind >& fault(void) const;
    const std::string& output_text(void) const;
    const std::string& error_text(void) const;
    const utils::optional< int >& exit_code(void) const;
    const utils::datetime::delta& elapsed(void) const;
    const utils::optional< std::string >& message(void) const;
    const utils::optional< std::string >& raw_output(void) const;
    const std::vector< std::string >& warnings(void) const;
    const std::string& backend(void) const;

    void add_warning(const std::string&);
    void set_backend(const std::string&);
    void set_raw_output(const std::string&);

    bool operator==(const program_result&) const;
    bool operator!=(const program_result&) const;
};


std::ostream& operator<<(std::ostream&, const program_request&);
std::ostream& operator<<(std::ostream&, const program_result&);


}  // namespace model

#endif  // !defined(MODEL_PROGRAM_HPP)
