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

#include "model/execution_request.hpp"

#include <sstream>

#include <atf-c++.hpp>

#include "model/exceptions.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;
namespace json = nlohmann;

using utils::none;


namespace {


/// Builds a list with two trivial test cases.
///
/// \return The test cases.
static model::test_cases_vector
two_test_cases(void)
{
    model::test_cases_vector test_cases;
    test_cases.push_back(model::test_case(json::json::array({1, 2}),
                                          json::json(3)));
    test_cases.push_back(model::test_case(json::json::array({-1, 1}),
                                          json::json(0), true,
                                          utils::make_optional(
                                              std::string("Negatives"))));
    return test_cases;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(ctor_and_getters);
ATF_TEST_CASE_BODY(ctor_and_getters)
{
    const model::execution_request request(
        model::language_python, "def add(a, b): return a + b",
        two_test_cases());
    ATF_REQUIRE_EQ(model::language_python, request.language());
    ATF_REQUIRE_EQ("def add(a, b): return a + b", request.code());
    ATF_REQUIRE_EQ(2, request.test_cases().size());
    ATF_REQUIRE(two_test_cases() == request.test_cases());
    ATF_REQUIRE(!request.entry_point());
    ATF_REQUIRE(model::resource_limits() == request.limits());

    const model::test_case& second = request.test_cases()[1];
    ATF_REQUIRE(second.hidden());
    ATF_REQUIRE_EQ("Negatives", second.explanation().get());
}


ATF_TEST_CASE_WITHOUT_HEAD(entry_point__ok);
ATF_TEST_CASE_BODY(entry_point__ok)
{
    const model::execution_request request(
        model::language_javascript, "function _run2() {}",
        model::test_cases_vector(),
        utils::make_optional(std::string("_run2")));
    ATF_REQUIRE_EQ("_run2", request.entry_point().get());
}


ATF_TEST_CASE_WITHOUT_HEAD(entry_point__invalid);
ATF_TEST_CASE_BODY(entry_point__invalid)
{
    ATF_REQUIRE_THROW_RE(
        model::format_error, "Invalid entry point name '2fast'",
        model::execution_request(model::language_python, "",
                                 model::test_cases_vector(),
                                 utils::make_optional(std::string("2fast"))));
    ATF_REQUIRE_THROW_RE(
        model::format_error, "Invalid entry point name 'os.system'",
        model::execution_request(model::language_python, "",
                                 model::test_cases_vector(),
                                 utils::make_optional(
                                     std::string("os.system"))));
}


ATF_TEST_CASE_WITHOUT_HEAD(with_limits);
ATF_TEST_CASE_BODY(with_limits)
{
    const model::execution_request request(
        model::language_python, "code", two_test_cases());
    const model::resource_limits limits(1024, 1.0, datetime::delta(2, 0),
                                        false);
    const model::execution_request request2 = request.with_limits(limits);

    ATF_REQUIRE(model::resource_limits() == request.limits());
    ATF_REQUIRE(limits == request2.limits());
    ATF_REQUIRE_EQ("code", request2.code());
    ATF_REQUIRE(request != request2);
}


ATF_TEST_CASE_WITHOUT_HEAD(compare);
ATF_TEST_CASE_BODY(compare)
{
    const model::execution_request request1(
        model::language_python, "code", two_test_cases());
    const model::execution_request request2(
        model::language_python, "code", two_test_cases());
    const model::execution_request request3(
        model::language_python, "code", model::test_cases_vector());

    ATF_REQUIRE(request1 == request1);
    ATF_REQUIRE(request1 == request2);
    ATF_REQUIRE(request1 != request3);
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    std::ostringstream str;
    str << model::execution_request(model::language_python, "code",
                                     two_test_cases(),
                                     utils::make_optional(std::string("f")));
    ATF_REQUIRE_MATCH("^execution_request\\{language=python, test_cases=2, "
                      "entry_point=f, limits=resource_limits", str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, ctor_and_getters);
    ATF_ADD_TEST_CASE(tcs, entry_point__ok);
    ATF_ADD_TEST_CASE(tcs, entry_point__invalid);
    ATF_ADD_TEST_CASE(tcs, with_limits);
    ATF_ADD_TEST_CASE(tcs, compare);
    ATF_ADD_TEST_CASE(tcs, output);
}
