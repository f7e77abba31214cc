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

#include <sstream>

#include <atf-c++.hpp>

#include "utils/optional.ipp"

namespace datetime = utils::datetime;
namespace json = nlohmann;

using utils::none;


namespace {


/// Builds a test result with the given outcome and duration.
///
/// \param id The 1-based identifier of the test case.
/// \param passed Whether the test passed.
/// \param millis Duration of the test in milliseconds.
///
/// \return The test result.
static model::test_result
make_test_result(const int id, const bool passed, const int millis)
{
    return model::test_result(
        id, model::test_case(json::json(id), json::json(id)), passed,
        json::json(passed ? id : -1), "", "",
        datetime::delta::from_microseconds(millis * 1000));
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(make_success__metrics);
ATF_TEST_CASE_BODY(make_success__metrics)
{
    model::test_results_vector results;
    results.push_back(make_test_result(1, true, 10));
    results.push_back(make_test_result(2, false, 40));
    results.push_back(make_test_result(3, true, 10));
    results.push_back(make_test_result(4, true, 20));

    const model::execution_result result =
        model::execution_result::make_success(results,
                                              datetime::delta(0, 80000));
    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE(!result.fault());
    ATF_REQUIRE(!result.message());
    ATF_REQUIRE_EQ(3, result.passed());
    ATF_REQUIRE_EQ(1, result.failed());
    ATF_REQUIRE_EQ(results.size(), result.passed() + result.failed());
    ATF_REQUIRE(!result.all_passed());
    ATF_REQUIRE(datetime::delta(0, 20000) == result.average_time());
    ATF_REQUIRE(datetime::delta(0, 40000) == result.max_time());
    ATF_REQUIRE_EQ(0.75, result.success_rate());
}


ATF_TEST_CASE_WITHOUT_HEAD(make_success__all_passed);
ATF_TEST_CASE_BODY(make_success__all_passed)
{
    model::test_results_vector results;
    results.push_back(make_test_result(1, true, 1));
    const model::execution_result result =
        model::execution_result::make_success(results, datetime::delta());
    ATF_REQUIRE(result.all_passed());
    ATF_REQUIRE_EQ(1.0, result.success_rate());
}


ATF_TEST_CASE_WITHOUT_HEAD(make_success__empty);
ATF_TEST_CASE_BODY(make_success__empty)
{
    const model::execution_result result =
        model::execution_result::make_success(model::test_results_vector(),
                                              datetime::delta());
    ATF_REQUIRE_EQ(0, result.passed());
    ATF_REQUIRE_EQ(0, result.failed());
    ATF_REQUIRE(result.all_passed());
    ATF_REQUIRE(datetime::delta() == result.average_time());
    ATF_REQUIRE(datetime::delta() == result.max_time());
    ATF_REQUIRE_EQ(0.0, result.success_rate());
}


ATF_TEST_CASE_WITHOUT_HEAD(make_error);
ATF_TEST_CASE_BODY(make_error)
{
    model::execution_result result = model::execution_result::make_error(
        model::fault_environment, "Docker image not found: foo");
    ATF_REQUIRE_EQ(model::status_error, result.status());
    ATF_REQUIRE_EQ(model::fault_environment, result.fault().get());
    ATF_REQUIRE_EQ("Docker image not found: foo", result.message().get());
    ATF_REQUIRE(result.test_results().empty());
    ATF_REQUIRE(!result.all_passed());

    const model::execution_result harness_error =
        model::execution_result::make_error("No function found");
    ATF_REQUIRE(!harness_error.fault());
}


ATF_TEST_CASE_WITHOUT_HEAD(make_timeout);
ATF_TEST_CASE_BODY(make_timeout)
{
    const model::execution_result result =
        model::execution_result::make_timeout(
            "Execution timed out after 2 seconds", datetime::delta(2, 0));
    ATF_REQUIRE_EQ(model::status_timeout, result.status());
    ATF_REQUIRE_EQ(model::fault_timeout, result.fault().get());
    ATF_REQUIRE(datetime::delta(2, 0) == result.elapsed());
}


ATF_TEST_CASE_WITHOUT_HEAD(setters);
ATF_TEST_CASE_BODY(setters)
{
    model::execution_result result = model::execution_result::make_error(
        model::fault_protocol, "Failed to parse execution results");
    ATF_REQUIRE(result.warnings().empty());
    ATF_REQUIRE(result.backend().empty());

    result.add_warning("first");
    result.add_warning("second");
    result.set_backend("container");
    result.set_raw_output("garbage");
    result.set_traceback("Traceback...");

    ATF_REQUIRE_EQ(2, result.warnings().size());
    ATF_REQUIRE_EQ("second", result.warnings()[1]);
    ATF_REQUIRE_EQ("container", result.backend());
    ATF_REQUIRE_EQ("garbage", result.raw_output().get());
    ATF_REQUIRE_EQ("Traceback...", result.traceback().get());
}


ATF_TEST_CASE_WITHOUT_HEAD(compare);
ATF_TEST_CASE_BODY(compare)
{
    const model::execution_result result1 =
        model::execution_result::make_error("foo");
    model::execution_result result2 =
        model::execution_result::make_error("foo");
    ATF_REQUIRE(result1 == result2);
    result2.add_warning("bar");
    ATF_REQUIRE(result1 != result2);
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    std::ostringstream str;
    str << model::execution_result::make_error(model::fault_safety, "oops");
    ATF_REQUIRE_EQ("execution_result{status=error, fault=safety, passed=0, "
                   "failed=0, elapsed=0us, message=oops}", str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, make_success__metrics);
    ATF_ADD_TEST_CASE(tcs, make_success__all_passed);
    ATF_ADD_TEST_CASE(tcs, make_success__empty);
    ATF_ADD_TEST_CASE(tcs, make_error);
    ATF_ADD_TEST_CASE(tcs, make_timeout);
    ATF_ADD_TEST_CASE(tcs, setters);
    ATF_ADD_TEST_CASE(tcs, compare);
    ATF_ADD_TEST_CASE(tcs, output);
}
