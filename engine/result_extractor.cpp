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

#include "engine/result_extractor.hpp"

#include <cstring>

#include <nlohmann/json.hpp>

#include "engine/harness.hpp"
#include "model/exceptions.hpp"
#include "model/json.hpp"
#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;
namespace json = nlohmann;

using utils::none;
using utils::optional;


namespace {


/// Builds the result for output that does not carry a usable payload.
///
/// \param output The raw output of the harness, attached to the result.
/// \param message The description of the problem.
///
/// \return A protocol fault.
static model::execution_result
protocol_fault(const std::string& output, const std::string& message)
{
    model::execution_result result = model::execution_result::make_error(
        model::fault_protocol, message);
    result.set_raw_output(output);
    return result;
}


/// Gets a string field of the payload, if present.
///
/// \param doc The payload.
/// \param key The name of the field.
///
/// \return The value of the field, or none if it is missing or not a string.
static optional< std::string >
get_text(const json::json& doc, const char* key)
{
    const json::json::const_iterator iter = doc.find(key);
    if (iter == doc.end() || !(*iter).is_string())
        return none;
    return utils::make_optional((*iter).get< std::string >());
}


/// Converts the payload of a harness that could not run the tests.
///
/// \param doc The payload.
/// \param output The raw output of the harness.
///
/// \return An error result with the message reported by the harness.
static model::execution_result
harness_error(const json::json& doc, const std::string& output)
{
    const std::string message = get_text(doc, "error_message").get_default(
        "Harness reported an error without a message");
    model::execution_result result = model::execution_result::make_error(
        message);

    optional< std::string > traceback = get_text(doc, "traceback");
    if (!traceback)
        traceback = get_text(doc, "stack");
    if (traceback)
        result.set_traceback(traceback.get());
    result.set_raw_output(output);
    return result;
}


/// Converts the payload of a harness that ran the tests.
///
/// \param doc The payload.
/// \param request The request that the harness executed.
///
/// \return A success result.
///
/// \throw model::format_error If the payload is malformed or does not match
///     the test cases of the request.
static model::execution_result
harness_success(const json::json& doc, const model::execution_request& request)
{
    const json::json::const_iterator raw_results = doc.find("test_results");
    if (raw_results == doc.end() || !(*raw_results).is_array())
        throw model::format_error("Field 'test_results' must be a JSON array");

    const model::test_cases_vector& test_cases = request.test_cases();
    if ((*raw_results).size() != test_cases.size())
        throw model::format_error(F("Harness reported %s results for %s test "
                                    "cases") % (*raw_results).size() %
                                  test_cases.size());

    model::test_results_vector results;
    for (std::size_t i = 0; i < test_cases.size(); ++i) {
        const model::test_result result = model::test_result_from_json(
            (*raw_results)[i], test_cases[i]);
        if (result.id() != static_cast< int >(i + 1))
            throw model::format_error(F("Result %s has id %s") % (i + 1) %
                                      result.id());
        results.push_back(result);
    }

    datetime::delta elapsed;
    const json::json::const_iterator raw_time = doc.find("execution_time");
    if (raw_time != doc.end() && (*raw_time).is_number() &&
        (*raw_time).get< double >() >= 0)
        elapsed = datetime::delta::from_seconds((*raw_time).get< double >());
    return model::execution_result::make_success(results, elapsed);
}


/// Builds the result of a program whose output carries no usable payload.
///
/// \param output The raw output of the script, attached to the result.
/// \param message The description of the problem.
///
/// \return A protocol fault.
static model::program_result
program_protocol_fault(const std::string& output, const std::string& message)
{
    model::program_result result = model::program_result::make_error(
        model::fault_protocol, message);
    result.set_raw_output(output);
    return result;
}


}  // anonymous namespace


/// Locates the payload printed by a harness.
///
/// \param output The combined output of the harness.
///
/// \return The text between the first start marker and the first end marker
/// that follows it, or none if the markers are missing.
optional< std::string >
engine::find_payload(const std::string& output)
{
    const std::string::size_type start = output.find(harness::start_marker);
    if (start == std::string::npos)
        return none;
    const std::string::size_type payload_start =
        start + std::strlen(harness::start_marker);

    const std::string::size_type end = output.find(harness::end_marker,
                                                   payload_start);
    if (end == std::string::npos)
        return none;
    return utils::make_optional(output.substr(payload_start,
                                              end - payload_start));
}


/// Converts the output of a harness into the result of a request.
///
/// \param output The combined output of the harness.
/// \param request The request that the harness executed.
///
/// \return The result reported by the harness, or a protocol fault with the
/// raw output attached if the output does not carry a valid payload.
model::execution_result
engine::extract_result(const std::string& output,
                       const model::execution_request& request)
{
    const optional< std::string > payload = find_payload(output);
    if (!payload) {
        LW("Harness output does not contain the results markers");
        return protocol_fault(output, "Failed to parse execution results");
    }

    json::json doc;
    try {
        doc = json::json::parse(payload.get());
    } catch (const json::json::parse_error& e) {
        LW(F("Invalid results payload: %s") % e.what());
        return protocol_fault(output, "Failed to parse execution results");
    }

    if (!doc.is_object())
        return protocol_fault(output, "Failed to parse execution results");

    const optional< std::string > status = get_text(doc, "status");
    if (status && status.get() == "error")
        return harness_error(doc, output);
    else if (!status || status.get() != "success")
        return protocol_fault(output, F("Unknown harness status %s") %
                              doc.value("status", json::json()).dump());

    try {
        return harness_success(doc, request);
    } catch (const model::format_error& e) {
        LW(F("Invalid results payload: %s") % e.what());
        return protocol_fault(output, e.what());
    }
}


/// Converts the output of a program script into the result of the program.
///
/// \param output The combined output of the script.
///
/// \return The outcome of the program as reported by the script, or a
/// protocol fault with the raw output attached if the output does not carry
/// a valid payload.
model::program_result
engine::extract_program_result(const std::string& output)
{
    const optional< std::string > payload = find_payload(output);
    if (!payload) {
        LW("Program output does not contain the results markers");
        return program_protocol_fault(output,
                                      "Failed to parse execution results");
    }

    json::json doc;
    try {
        doc = json::json::parse(payload.get());
    } catch (const json::json::parse_error& e) {
        LW(F("Invalid program payload: %s") % e.what());
        return program_protocol_fault(output,
                                      "Failed to parse execution results");
    }
    if (!doc.is_object())
        return program_protocol_fault(output,
                                      "Failed to parse execution results");

    const optional< std::string > status = get_text(doc, "status");
    if (status && status.get() == "error") {
        model::program_result result = model::program_result::make_error(
            model::fault_environment,
            F("Execution error: %s") % get_text(doc, "error_message")
            .get_default("Program runner failed without a message"));
        result.set_raw_output(output);
        return result;
    } else if (!status || status.get() != "completed") {
        return program_protocol_fault(
            output, F("Unknown harness status %s") %
            doc.value("status", json::json()).dump());
    }

    const optional< std::string > stdout_text = get_text(doc, "stdout");
    const optional< std::string > stderr_text = get_text(doc, "stderr");
    const json::json::const_iterator exit_code = doc.find("exit_code");
    if (!stdout_text || !stderr_text || exit_code == doc.end() ||
        !(*exit_code).is_number_integer())
        return program_protocol_fault(output,
                                      "Invalid program results payload");

    datetime::delta elapsed;
    const json::json::const_iterator raw_time = doc.find("execution_time");
    if (raw_time != doc.end() && (*raw_time).is_number() &&
        (*raw_time).get< double >() >= 0)
        elapsed = datetime::delta::from_seconds((*raw_time).get< double >());

    return model::program_result::make_completed(
        stdout_text.get(), stderr_text.get(), (*exit_code).get< int >(),
        elapsed);
}
