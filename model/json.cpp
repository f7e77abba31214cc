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

#include "model/json.hpp"

#include "model/exceptions.hpp"
#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace json = nlohmann;

using utils::none;
using utils::optional;


namespace {


/// Ensures that a JSON value is an object.
///
/// \param value The value to check.
/// \param what Description of the value for error messages.
///
/// \throw model::format_error If the value is not an object.
static void
require_object(const json::json& value, const char* what)
{
    if (!value.is_object())
        throw model::format_error(F("%s must be a JSON object") % what);
}


/// Looks up a field in a JSON object.
///
/// \param object The object to query.
/// \param key The name of the field.
///
/// \return A pointer to the value, or NULL if missing or null.
static const json::json*
find_field(const json::json& object, const char* key)
{
    const json::json::const_iterator iter = object.find(key);
    if (iter == object.end() || (*iter).is_null())
        return NULL;
    return &(*iter);
}


/// Reads a mandatory string field.
///
/// \param object The object to query.
/// \param key The name of the field.
///
/// \return The value of the field.
///
/// \throw model::format_error If the field is missing or not a string.
static std::string
get_string(const json::json& object, const char* key)
{
    const json::json* value = find_field(object, key);
    if (value == NULL)
        throw model::format_error(F("Missing required field '%s'") % key);
    if (!value->is_string())
        throw model::format_error(F("Field '%s' must be a string") % key);
    return value->get< std::string >();
}


/// Reads an optional string field.
///
/// \param object The object to query.
/// \param key The name of the field.
///
/// \return The value of the field, or none if missing or empty.
///
/// \throw model::format_error If the field is not a string.
static optional< std::string >
get_optional_string(const json::json& object, const char* key)
{
    const json::json* value = find_field(object, key);
    if (value == NULL)
        return none;
    if (!value->is_string())
        throw model::format_error(F("Field '%s' must be a string") % key);
    const std::string text = value->get< std::string >();
    if (text.empty())
        return none;
    return utils::make_optional(text);
}


/// Reads an optional boolean field.
///
/// \param object The object to query.
/// \param key The name of the field.
/// \param default_value Value to return if the field is missing.
///
/// \return The value of the field.
///
/// \throw model::format_error If the field is not a boolean.
static bool
get_bool(const json::json& object, const char* key, const bool default_value)
{
    const json::json* value = find_field(object, key);
    if (value == NULL)
        return default_value;
    if (!value->is_boolean())
        throw model::format_error(F("Field '%s' must be a boolean") % key);
    return value->get< bool >();
}


/// Reads an optional time field expressed in seconds.
///
/// \param object The object to query.
/// \param key The name of the field.
///
/// \return The value of the field, or zero if missing.
///
/// \throw model::format_error If the field is not a non-negative number.
static datetime::delta
get_seconds(const json::json& object, const char* key)
{
    const json::json* value = find_field(object, key);
    if (value == NULL)
        return datetime::delta();
    if (!value->is_number() || value->get< double >() < 0)
        throw model::format_error(F("Field '%s' must be a non-negative "
                                    "number") % key);
    return datetime::delta::from_seconds(value->get< double >());
}


/// Parses the resource limits of a request.
///
/// \param object The request object.
/// \param defaults Limits to use for the fields that are not present.
///
/// \return The resource limits.
///
/// \throw model::format_error If any limit is invalid.
static model::resource_limits
parse_limits(const json::json& object, const model::resource_limits& defaults)
{
    uint64_t memory = defaults.memory_bytes();
    const json::json* raw_memory = find_field(object, "memory_limit");
    if (raw_memory != NULL) {
        if (raw_memory->is_string())
            memory = model::resource_limits::parse_memory(
                raw_memory->get< std::string >());
        else if (raw_memory->is_number_unsigned())
            memory = raw_memory->get< uint64_t >();
        else
            throw model::format_error("Field 'memory_limit' must be a string "
                                      "or a positive integer");
    }

    double cpu = defaults.cpu_share();
    const json::json* raw_cpu = find_field(object, "cpu_limit");
    if (raw_cpu != NULL) {
        if (!raw_cpu->is_number())
            throw model::format_error("Field 'cpu_limit' must be a number");
        cpu = raw_cpu->get< double >();
    }

    datetime::delta timeout = defaults.timeout();
    if (find_field(object, "timeout") != NULL)
        timeout = get_seconds(object, "timeout");

    const bool network = get_bool(object, "network", defaults.network());

    return model::resource_limits(memory, cpu, timeout, network);
}


/// Converts a time delta to the seconds representation of the payloads.
///
/// \param delta The time delta.
///
/// \return The amount of seconds as a floating point number.
static json::json
seconds(const datetime::delta& delta)
{
    return json::json(delta.to_seconds());
}


/// Converts an optional string to a JSON value.
///
/// \param value The value to convert.
///
/// \return The string or null.
static json::json
string_or_null(const optional< std::string >& value)
{
    if (value)
        return json::json(value.get());
    else
        return json::json();
}


}  // anonymous namespace


/// Converts a test case to JSON.
///
/// \param object The test case to convert.
///
/// \return A JSON object suitable for the harness payload.
json::json
model::test_case_to_json(const test_case& object)
{
    json::json doc = json::json::object();
    doc["input"] = object.input();
    doc["expected_output"] = object.expected_output();
    doc["is_hidden"] = object.hidden();
    doc["explanation"] = object.explanation().get_default("");
    return doc;
}


/// Parses a test case from JSON.
///
/// The legacy field name "expected" is accepted in place of
/// "expected_output".
///
/// \param doc The JSON object to parse.
///
/// \return The test case.
///
/// \throw format_error If the document is invalid.
model::test_case
model::test_case_from_json(const json::json& doc)
{
    require_object(doc, "Test case");

    json::json::const_iterator input = doc.find("input");
    if (input == doc.end())
        throw format_error("Missing required field 'input'");

    json::json::const_iterator expected = doc.find("expected_output");
    if (expected == doc.end()) {
        expected = doc.find("expected");
        if (expected == doc.end())
            throw format_error("Missing required field 'expected_output'");
    }

    return test_case(*input, *expected, get_bool(doc, "is_hidden", false),
                     get_optional_string(doc, "explanation"));
}


/// Converts a collection of test cases to JSON.
///
/// \param objects The test cases to convert.
///
/// \return A JSON array.
json::json
model::test_cases_to_json(const test_cases_vector& objects)
{
    json::json doc = json::json::array();
    for (test_cases_vector::const_iterator iter = objects.begin();
         iter != objects.end(); ++iter)
        doc.push_back(test_case_to_json(*iter));
    return doc;
}


/// Parses a collection of test cases from JSON.
///
/// \param doc The JSON array to parse.
///
/// \return The test cases in their original order.
///
/// \throw format_error If the document is invalid.
model::test_cases_vector
model::test_cases_from_json(const json::json& doc)
{
    if (!doc.is_array())
        throw format_error("Test cases must be a JSON array");

    test_cases_vector test_cases;
    std::size_t position = 1;
    for (json::json::const_iterator iter = doc.begin(); iter != doc.end();
         ++iter, ++position) {
        try {
            test_cases.push_back(test_case_from_json(*iter));
        } catch (const format_error& e) {
            throw format_error(F("Invalid test case %s: %s") % position %
                               e.what());
        }
    }
    return test_cases;
}


/// Parses an execution request from JSON.
///
/// \param doc The JSON object to parse.  The entry point can be given as
///     "entry_point" or as "function_name".
/// \param defaults Resource limits for the fields not present in doc.
///
/// \return The request.
///
/// \throw format_error If the document is invalid.
model::execution_request
model::request_from_json(const json::json& doc, const resource_limits& defaults)
{
    require_object(doc, "Request");

    const model::language lang = language_from_name(get_string(doc,
                                                               "language"));
    const std::string code = get_string(doc, "code");

    const json::json* raw_test_cases = find_field(doc, "test_cases");
    if (raw_test_cases == NULL)
        throw format_error("Missing required field 'test_cases'");

    optional< std::string > entry_point = get_optional_string(doc,
                                                              "entry_point");
    if (!entry_point)
        entry_point = get_optional_string(doc, "function_name");

    return execution_request(lang, code, test_cases_from_json(*raw_test_cases),
                             entry_point, parse_limits(doc, defaults));
}


/// Parses a collection of execution requests from JSON.
///
/// \param doc The JSON array to parse.
/// \param defaults Resource limits for the fields not present in the
///     requests.
///
/// \return The requests in their original order.
///
/// \throw format_error If the document is invalid.
std::vector< model::execution_request >
model::requests_from_json(const json::json& doc,
                          const resource_limits& defaults)
{
    if (!doc.is_array())
        throw format_error("Requests must be a JSON array");

    std::vector< execution_request > requests;
    std::size_t position = 1;
    for (json::json::const_iterator iter = doc.begin(); iter != doc.end();
         ++iter, ++position) {
        try {
            requests.push_back(request_from_json(*iter, defaults));
        } catch (const format_error& e) {
            throw format_error(F("Invalid request %s: %s") % position %
                               e.what());
        }
    }
    return requests;
}


/// Converts a test result to JSON.
///
/// \param object The test result to convert.
///
/// \return A JSON object.
json::json
model::test_result_to_json(const test_result& object)
{
    json::json doc = test_case_to_json(object.test_case());
    doc["test_case_id"] = object.id();
    doc["passed"] = object.passed();
    doc["execution_time"] = seconds(object.elapsed());
    doc["output"] = object.output();
    doc["error"] = string_or_null(object.error());
    doc["stdout"] = object.stdout_text();
    doc["stderr"] = object.stderr_text();
    if (object.traceback())
        doc["traceback"] = object.traceback().get();
    return doc;
}


/// Parses a test result reported by a harness.
///
/// The echoed test case fields of the document are ignored in favor of the
/// test case that was actually sent to the harness.
///
/// \param doc The JSON object to parse.
/// \param test_case_ The test case the result belongs to.
///
/// \return The test result.
///
/// \throw format_error If the document is invalid.
model::test_result
model::test_result_from_json(const json::json& doc,
                             const test_case& test_case_)
{
    require_object(doc, "Test result");

    const json::json* raw_id = find_field(doc, "test_case_id");
    if (raw_id == NULL || !raw_id->is_number_integer() ||
        raw_id->get< int >() < 1)
        throw format_error("Field 'test_case_id' must be a positive integer");

    const json::json* raw_output = find_field(doc, "output");

    optional< std::string > error;
    const json::json* raw_error = find_field(doc, "error");
    if (raw_error != NULL && !raw_error->is_boolean())
        error = get_optional_string(doc, "error");

    optional< std::string > traceback = get_optional_string(doc, "traceback");
    if (!traceback)
        traceback = get_optional_string(doc, "stack");

    return test_result(
        raw_id->get< int >(), test_case_, get_bool(doc, "passed", false),
        raw_output == NULL ? json::json() : *raw_output,
        get_optional_string(doc, "stdout").get_default(""),
        get_optional_string(doc, "stderr").get_default(""),
        get_seconds(doc, "execution_time"), error, traceback);
}


/// Converts an execution result to JSON.
///
/// \param object The execution result to convert.
///
/// \return A JSON object.
json::json
model::result_to_json(const execution_result& object)
{
    json::json doc = json::json::object();
    doc["status"] = status_name(object.status());
    doc["passed"] = object.passed();
    doc["failed"] = object.failed();
    doc["error"] = object.status() != status_success;
    doc["execution_time"] = seconds(object.elapsed());

    json::json results = json::json::array();
    for (test_results_vector::const_iterator iter =
             object.test_results().begin();
         iter != object.test_results().end(); ++iter)
        results.push_back(test_result_to_json(*iter));
    doc["test_results"] = results;

    doc["all_passed"] = object.all_passed();
    json::json metrics = json::json::object();
    metrics["avg_execution_time"] = seconds(object.average_time());
    metrics["max_execution_time"] = seconds(object.max_time());
    metrics["success_rate"] = object.success_rate();
    doc["detailed_metrics"] = metrics;

    if (object.message())
        doc["error_message"] = object.message().get();
    if (object.fault())
        doc["fault"] = fault_name(object.fault().get());
    if (object.traceback())
        doc["traceback"] = object.traceback().get();
    if (object.raw_output())
        doc["logs"] = object.raw_output().get();
    if (!object.warnings().empty())
        doc["warnings"] = object.warnings();
    if (!object.backend().empty())
        doc["backend"] = object.backend();
    return doc;
}


/// Parses a program request from JSON.
///
/// The standard input of the program is read from the "input" field, or from
/// the "stdin" field if the former is missing.  Both are optional.
///
/// \param doc The JSON object to parse.
/// \param defaults Resource limits for the fields not present in the request.
///
/// \return The parsed request.
///
/// \throw format_error If the document is invalid.
model::program_request
model::program_request_from_json(const json::json& doc,
                                 const resource_limits& defaults)
{
    require_object(doc, "Request");

    const model::language lang = language_from_name(get_string(doc,
                                                               "language"));
    const std::string code = get_string(doc, "code");

    optional< std::string > input = get_optional_string(doc, "input");
    if (!input)
        input = get_optional_string(doc, "stdin");

    return program_request(lang, code, input.get_default(""),
                           parse_limits(doc, defaults));
}


/// Converts a program result to JSON.
///
/// \param object The program result to convert.
///
/// \return A JSON object.
json::json
model::program_result_to_json(const program_result& object)
{
    json::json doc = json::json::object();
    doc["status"] = status_name(object.status());
    doc["error"] = object.status() != status_success;
    doc["stdout"] = object.output_text();
    doc["stderr"] = object.error_text();
    doc["exit_code"] = object.exit_code() ?
        json::json(object.exit_code().get()) : json::json();
    doc["execution_time"] = seconds(object.elapsed());

    if (object.message())
        doc["error_message"] = object.message().get();
    if (object.fault())
        doc["fault"] = fault_name(object.fault().get());
    if (object.raw_output())
        doc["logs"] = object.raw_output().get();
    if (!object.warnings().empty())
        doc["warnings"] = object.warnings();
    if (!object.backend().empty())
        doc["backend"] = object.backend();
    return doc;
}
