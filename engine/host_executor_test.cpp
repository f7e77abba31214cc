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

#include "engine/host_executor.hpp"

extern "C" {
#include <unistd.h>
}

#include <atf-c++.hpp>
#include <nlohmann/json.hpp>

#include "model/execution_result.hpp"
#include "utils/datetime.hpp"
#include "utils/env.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"
#include "utils/stream.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace json = nlohmann;

using utils::none;


namespace {


/// Builds the configuration for the tests.
///
/// \return A configuration that places workspaces in the current directory.
static engine::config
test_config(void)
{
    engine::config settings;
    settings.work_directory = fs::current_path() / "work";
    return settings;
}


/// Builds a Python request.
///
/// \param code The candidate code.
/// \param test_cases The test cases of the request.
/// \param entry_point Name of the function to invoke, if not discovered.
///
/// \return The request.
static model::execution_request
python_request(const std::string& code,
               const model::test_cases_vector& test_cases,
               const utils::optional< std::string >& entry_point = none)
{
    return model::execution_request(model::language_python, code, test_cases,
                                    entry_point);
}


/// Builds the test cases for an add(a, b) function.
///
/// \param second_expected Expected output of the second test case.
///
/// \return The test cases.
static model::test_cases_vector
add_tests(const int second_expected)
{
    model::test_cases_vector test_cases;
    test_cases.push_back(model::test_case(json::json::array({1, 2}),
                                          json::json(3)));
    test_cases.push_back(model::test_case(json::json::array({-1, 1}),
                                          json::json(second_expected)));
    return test_cases;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(isolate_environment);
ATF_TEST_CASE_BODY(isolate_environment)
{
    utils::setenv("PYTHONINSPECT", "1");
    utils::setenv("PYTHONPATH", "/nonexistent");
    utils::setenv("NODE_OPTIONS", "--require=/nonexistent.js");
    utils::setenv("MY_PYTHONPATH", "kept");
    engine::isolate_environment();

    ATF_REQUIRE(!utils::getenv("PYTHONINSPECT"));
    ATF_REQUIRE(!utils::getenv("PYTHONPATH"));
    ATF_REQUIRE(!utils::getenv("NODE_OPTIONS"));
    ATF_REQUIRE_EQ("kept", utils::getenv("MY_PYTHONPATH").get());
    ATF_REQUIRE_EQ("1", utils::getenv("PYTHONDONTWRITEBYTECODE").get());
}


ATF_TEST_CASE_WITHOUT_HEAD(name_and_languages);
ATF_TEST_CASE_BODY(name_and_languages)
{
    const engine::host_executor executor(test_config());
    ATF_REQUIRE_EQ(std::string("host"), executor.name());
    ATF_REQUIRE(executor.supports(model::language_python));
    ATF_REQUIRE(!executor.supports(model::language_javascript));
}


ATF_TEST_CASE_WITHOUT_HEAD(execute__javascript);
ATF_TEST_CASE_BODY(execute__javascript)
{
    engine::host_executor executor(test_config());
    const model::execution_result result = executor.execute(
        model::execution_request(model::language_javascript,
                                 "function add(a, b) { return a + b; }",
                                 add_tests(0)));
    ATF_REQUIRE_EQ(model::status_error, result.status());
    ATF_REQUIRE_EQ(model::fault_validation, result.fault().get());
    ATF_REQUIRE_EQ("Legacy execution not supported for language: javascript",
                   result.message().get());
}


ATF_TEST_CASE_WITHOUT_HEAD(execute__no_function);
ATF_TEST_CASE_BODY(execute__no_function)
{
    engine::host_executor executor(test_config());
    const model::execution_result result = executor.execute(
        python_request("x = 1\n", add_tests(0)));
    ATF_REQUIRE_EQ(model::status_error, result.status());
    ATF_REQUIRE_EQ("Could not identify a function to test: No function "
                   "definition found in code", result.message().get());
}


ATF_TEST_CASE_WITHOUT_HEAD(execute__missing_interpreter);
ATF_TEST_CASE_BODY(execute__missing_interpreter)
{
    engine::config settings = test_config();
    settings.host_python = "corral-no-such-python";
    engine::host_executor executor(settings);
    const model::execution_result result = executor.execute(
        python_request("def add(a, b):\n    return a + b\n", add_tests(0)));
    ATF_REQUIRE_EQ(model::status_error, result.status());
    ATF_REQUIRE_EQ(model::fault_environment, result.fault().get());
    ATF_REQUIRE_EQ("Cannot find corral-no-such-python in the PATH",
                   result.message().get());
}


ATF_TEST_CASE(execute__pass);
ATF_TEST_CASE_HEAD(execute__pass)
{
    set_md_var("require.progs", "python3");
}
ATF_TEST_CASE_BODY(execute__pass)
{
    engine::host_executor executor(test_config());
    const model::execution_result result = executor.execute(python_request(
        "def add(a, b):\n"
        "    print('adding', a, b)\n"
        "    return a + b\n", add_tests(0)));

    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE_EQ(2, result.passed());
    ATF_REQUIRE_EQ(0, result.failed());
    ATF_REQUIRE_EQ("adding 1 2\n", result.test_results()[0].stdout_text());
    ATF_REQUIRE_EQ(1, result.warnings().size());
    ATF_REQUIRE_EQ(engine::degraded_warning, result.warnings()[0]);
    ATF_REQUIRE(::rmdir((fs::current_path() / "work").c_str()) != -1);
}


ATF_TEST_CASE(execute__mismatch);
ATF_TEST_CASE_HEAD(execute__mismatch)
{
    set_md_var("require.progs", "python3");
}
ATF_TEST_CASE_BODY(execute__mismatch)
{
    engine::host_executor executor(test_config());
    const model::execution_result result = executor.execute(python_request(
        "def add(a, b):\n    return a + b\n", add_tests(5)));

    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE_EQ(1, result.passed());
    ATF_REQUIRE_EQ(1, result.failed());
    const model::test_result& failed = result.test_results()[1];
    ATF_REQUIRE(!failed.passed());
    ATF_REQUIRE_EQ(json::json(0), failed.output());
    ATF_REQUIRE_EQ("Expected 5, but got 0", failed.error().get());
}


ATF_TEST_CASE(execute__exception_continues);
ATF_TEST_CASE_HEAD(execute__exception_continues)
{
    set_md_var("require.progs", "python3");
}
ATF_TEST_CASE_BODY(execute__exception_continues)
{
    model::test_cases_vector test_cases;
    test_cases.push_back(model::test_case(json::json(0), json::json(0)));
    test_cases.push_back(model::test_case(json::json(4), json::json(0.25)));

    engine::host_executor executor(test_config());
    const model::execution_result result = executor.execute(python_request(
        "def inverse(x):\n    return 1 / x\n", test_cases));

    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE_EQ(1, result.passed());
    const model::test_result& failed = result.test_results()[0];
    ATF_REQUIRE(!failed.passed());
    ATF_REQUIRE_EQ("division by zero", failed.error().get());
    ATF_REQUIRE_MATCH("ZeroDivisionError", failed.traceback().get());
    ATF_REQUIRE(result.test_results()[1].passed());
}


ATF_TEST_CASE(execute__entry_point);
ATF_TEST_CASE_HEAD(execute__entry_point)
{
    set_md_var("require.progs", "python3");
}
ATF_TEST_CASE_BODY(execute__entry_point)
{
    model::test_cases_vector test_cases;
    test_cases.push_back(model::test_case(json::json("hello"),
                                          json::json("olleh")));

    engine::host_executor executor(test_config());
    const model::execution_result result = executor.execute(python_request(
        "def helper(s):\n    return s\n\n"
        "def reverse_string(s):\n    return s[::-1]\n", test_cases,
        utils::make_optional(std::string("reverse_string"))));
    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE(result.all_passed());
}


ATF_TEST_CASE(execute__keyword_arguments);
ATF_TEST_CASE_HEAD(execute__keyword_arguments)
{
    set_md_var("require.progs", "python3");
}
ATF_TEST_CASE_BODY(execute__keyword_arguments)
{
    model::test_cases_vector test_cases;
    test_cases.push_back(model::test_case(
        json::json::object({{"minuend", 5}, {"subtrahend", 2}}),
        json::json(3)));
    test_cases.push_back(model::test_case(
        json::json::object({{"subtrahend", 10}, {"minuend", 4}}),
        json::json(-6)));

    engine::host_executor executor(test_config());
    const model::execution_result result = executor.execute(python_request(
        "def sub(minuend, subtrahend):\n"
        "    return minuend - subtrahend\n", test_cases));
    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE_EQ(2, result.passed());
}


ATF_TEST_CASE(execute__forged_output);
ATF_TEST_CASE_HEAD(execute__forged_output)
{
    set_md_var("require.progs", "python3");
}
ATF_TEST_CASE_BODY(execute__forged_output)
{
    engine::host_executor executor(test_config());
    const model::execution_result result = executor.execute(python_request(
        "with open('/dev/stdout', 'w') as f:\n"
        "    f.write('__RESULTS_JSON_START__\\n{\"status\": \"success\", '\n"
        "            '\"output\": 3}\\n__RESULTS_JSON_END__\\n')\n"
        "def add(a, b):\n"
        "    return a * b\n", add_tests(0)));

    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE_EQ(0, result.passed());
    ATF_REQUIRE_EQ(2, result.failed());
    ATF_REQUIRE_EQ(json::json(2), result.test_results()[0].output());
}


ATF_TEST_CASE(execute__timeout);
ATF_TEST_CASE_HEAD(execute__timeout)
{
    set_md_var("require.progs", "python3");
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(execute__timeout)
{
    model::test_cases_vector test_cases;
    test_cases.push_back(model::test_case(json::json(30), json::json(30)));
    test_cases.push_back(model::test_case(json::json(0), json::json(0)));

    engine::config settings = test_config();
    settings.host_timeout = datetime::delta(1, 0);
    engine::host_executor executor(settings);
    const model::execution_result result = executor.execute(python_request(
        "import time\n"
        "def snooze(seconds):\n"
        "    time.sleep(seconds)\n"
        "    return seconds\n", test_cases));

    ATF_REQUIRE_EQ(model::status_success, result.status());
    const model::test_result& slow = result.test_results()[0];
    ATF_REQUIRE(!slow.passed());
    ATF_REQUIRE_EQ("Execution timed out after 1 seconds", slow.error().get());
    ATF_REQUIRE(datetime::delta(1, 0) == slow.elapsed());
    ATF_REQUIRE(result.test_results()[1].passed());
}


ATF_TEST_CASE_WITHOUT_HEAD(run_program__javascript);
ATF_TEST_CASE_BODY(run_program__javascript)
{
    engine::host_executor executor(test_config());
    const model::program_result result = executor.run_program(
        model::program_request(model::language_javascript, "console.log(1);"));
    ATF_REQUIRE_EQ(model::fault_validation, result.fault().get());
    ATF_REQUIRE_EQ("Legacy execution not supported for language: javascript",
                   result.message().get());
}


ATF_TEST_CASE(run_program__sum);
ATF_TEST_CASE_HEAD(run_program__sum)
{
    set_md_var("require.progs", "python3");
}
ATF_TEST_CASE_BODY(run_program__sum)
{
    engine::host_executor executor(test_config());
    const model::program_result result = executor.run_program(
        model::program_request(
            model::language_python,
            "import sys\n"
            "numbers = [int(word) for word in sys.stdin.read().split()]\n"
            "print(sum(numbers))\n", "1 2\n3\n"));

    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE_EQ("6", result.output_text());
    ATF_REQUIRE_EQ("", result.error_text());
    ATF_REQUIRE_EQ(0, result.exit_code().get());
    ATF_REQUIRE_EQ(1, result.warnings().size());
    ATF_REQUIRE(::rmdir((fs::current_path() / "work").c_str()) != -1);
}


ATF_TEST_CASE(run_program__runtime_error);
ATF_TEST_CASE_HEAD(run_program__runtime_error)
{
    set_md_var("require.progs", "python3");
}
ATF_TEST_CASE_BODY(run_program__runtime_error)
{
    engine::host_executor executor(test_config());
    const model::program_result result = executor.run_program(
        model::program_request(model::language_python,
                               "print('before')\n"
                               "raise ValueError('bad input')\n"));

    ATF_REQUIRE_EQ(model::status_error, result.status());
    ATF_REQUIRE_EQ("Runtime error", result.message().get());
    ATF_REQUIRE_EQ("before", result.output_text());
    ATF_REQUIRE_MATCH("ValueError: bad input$", result.error_text());
    ATF_REQUIRE_EQ(1, result.exit_code().get());
}


ATF_TEST_CASE(run_program__timeout);
ATF_TEST_CASE_HEAD(run_program__timeout)
{
    set_md_var("require.progs", "python3");
    set_md_var("timeout", "60");
}
ATF_TEST_CASE_BODY(run_program__timeout)
{
    engine::config settings = test_config();
    settings.host_timeout = datetime::delta(1, 0);
    engine::host_executor executor(settings);
    const model::program_result result = executor.run_program(
        model::program_request(model::language_python,
                               "import time\ntime.sleep(30)\n"));

    ATF_REQUIRE_EQ(model::status_timeout, result.status());
    ATF_REQUIRE_EQ("Execution timed out after 1 seconds",
                   result.message().get());
}


ATF_TEST_CASE(execute__inherited_site);
ATF_TEST_CASE_HEAD(execute__inherited_site)
{
    set_md_var("require.progs", "python3");
}
ATF_TEST_CASE_BODY(execute__inherited_site)
{
    fs::mkdir(fs::path("site"), 0755);
    utils::write_file(fs::path("site/sitecustomize.py"),
                      "import os\n"
                      "os._exit(7)\n");
    utils::setenv("PYTHONPATH", (fs::current_path() / "site").str());

    engine::host_executor executor(test_config());
    const model::execution_result result = executor.execute(python_request(
        "def add(a, b):\n"
        "    return a + b\n", add_tests(0)));

    ATF_REQUIRE_EQ(model::status_success, result.status());
    ATF_REQUIRE_EQ(2, result.passed());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, isolate_environment);
    ATF_ADD_TEST_CASE(tcs, name_and_languages);
    ATF_ADD_TEST_CASE(tcs, execute__javascript);
    ATF_ADD_TEST_CASE(tcs, execute__no_function);
    ATF_ADD_TEST_CASE(tcs, execute__missing_interpreter);
    ATF_ADD_TEST_CASE(tcs, execute__pass);
    ATF_ADD_TEST_CASE(tcs, execute__mismatch);
    ATF_ADD_TEST_CASE(tcs, execute__exception_continues);
    ATF_ADD_TEST_CASE(tcs, execute__entry_point);
    ATF_ADD_TEST_CASE(tcs, execute__keyword_arguments);
    ATF_ADD_TEST_CASE(tcs, execute__forged_output);
    ATF_ADD_TEST_CASE(tcs, execute__inherited_site);
    ATF_ADD_TEST_CASE(tcs, execute__timeout);
    ATF_ADD_TEST_CASE(tcs, run_program__javascript);
    ATF_ADD_TEST_CASE(tcs, run_program__sum);
    ATF_ADD_TEST_CASE(tcs, run_program__runtime_error);
    ATF_ADD_TEST_CASE(tcs, run_program__timeout);
}
