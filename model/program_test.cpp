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

#include <sstream>

#include <atf-c++.hpp>

#include "utils/optional.ipp"

namespace datetime = utils::datetime;


ATF_TEST_CASE_WITHOUT_HEAD(program_request__defaults);
ATF_TEST_CASE_BODY(program_request__defaults)
{
    const model::program_request request(model::language_python,
                                         "print(1)\n");
    ATF_REQUIRE_EQ(model::language_python, request.language());
    ATF_REQUIRE_EQ("print(1)\n", request.code());
    ATF_REQUIRE_EQ("", request.input());
    ATF_REQUIRE(model::resource_limits() == request.limits());
}


ATF_TEST_CASE_WITHOUT_HEAD(program_request__with_limits);
ATF_TEST_CASE_BODY(program_request__with_limits)
{
    const model::program_request request(model::language_javascript, "x",
                                         "1 2\n");
    const model::resource_limits limits(1024, 1.0, datetime::delta(7, 0),
                                        true);
    const model::program_request other = request.with_limits(limits);
    ATF_REQUIRE(limits == other.limits());
    ATF_REQUIRE_EQ("1 2\n", other.input());
    ATF_REQUIRE(request != other);
    ATF_REQUIRE(request == other.with_limits(request.limits()));
}


ATF_TEST_CASE_WITHOUT_HEAD(program_result__completed__success);
ATF_TEST_CASE_BODY(program_result__completed__success)
{
    const model::program_result result =
        model::program_result::make_completed("  hello\nworld\n\n", "\n", 0,
                                              datetime::delta(1, 0));
    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE(!result.fault());
    ATF_REQUIRE_EQ("hello\nworld", result.output_text());
    ATF_REQUIRE_EQ("", result.error_text());
    ATF_REQUIRE_EQ(0, result.exit_code().get());
    ATF_REQUIRE(!result.message());
}


ATF_TEST_CASE_WITHOUT_HEAD(program_result__completed__stderr);
ATF_TEST_CASE_BODY(program_result__completed__stderr)
{
    const model::program_result result =
        model::program_result::make_completed("partial\n", "Traceback...\n",
                                              1, datetime::delta());
    ATF_REQUIRE_EQ(model::status_error, result.status());
    ATF_REQUIRE(!result.fault());
    ATF_REQUIRE_EQ("partial", result.output_text());
    ATF_REQUIRE_EQ("Traceback...", result.error_text());
    ATF_REQUIRE_EQ("Runtime error", result.message().get());
}


ATF_TEST_CASE_WITHOUT_HEAD(program_result__completed__exit_code);
ATF_TEST_CASE_BODY(program_result__completed__exit_code)
{
    const model::program_result result =
        model::program_result::make_completed("", "", 3, datetime::delta());
    ATF_REQUIRE_EQ(model::status_error, result.status());
    ATF_REQUIRE_EQ("Program exited with code 3", result.message().get());
}


ATF_TEST_CASE_WITHOUT_HEAD(program_result__error_and_timeout);
ATF_TEST_CASE_BODY(program_result__error_and_timeout)
{
    model::program_result error = model::program_result::make_error(
        model::fault_environment, "Container execution failed: boom");
    ATF_REQUIRE_EQ(model::status_error, error.status());
    ATF_REQUIRE_EQ(model::fault_environment, error.fault().get());
    ATF_REQUIRE(!error.exit_code());
    error.set_backend("host");
    error.add_warning("degraded");
    ATF_REQUIRE_EQ("host", error.backend());
    ATF_REQUIRE_EQ(1, error.warnings().size());

    const model::program_result timeout = model::program_result::make_timeout(
        "Execution timed out after 5 seconds", datetime::delta(5, 0));
    ATF_REQUIRE_EQ(model::status_timeout, timeout.status());
    ATF_REQUIRE_EQ(model::fault_timeout, timeout.fault().get());
    ATF_REQUIRE(datetime::delta(5, 0) == timeout.elapsed());

    std::ostringstream str;
    str << timeout;
    ATF_REQUIRE(str.str().find("status=timeout") != std::string::npos);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, program_request__defaults);
    ATF_ADD_TEST_CASE(tcs, program_request__with_limits);
    ATF_ADD_TEST_CASE(tcs, program_result__completed__success);
    ATF_ADD_TEST_CASE(tcs, program_result__completed__stderr);
    ATF_ADD_TEST_CASE(tcs, program_result__completed__exit_code);
    ATF_ADD_TEST_CASE(tcs, program_result__error_and_timeout);
}
