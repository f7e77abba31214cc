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

extern char** environ;
}

#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/comparator.hpp"
#include "engine/entry_point.hpp"
#include "engine/exceptions.hpp"
#include "engine/harness.hpp"
#include "engine/result_extractor.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/auto_cleaners.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/optional.ipp"
#include "utils/process/exceptions.hpp"
#include "utils/process/executor.hpp"
#include "utils/stream.hpp"
#include "utils/text/operations.hpp"

namespace datetime = utils::datetime;
namespace executor = utils::process::executor;
namespace fs = utils::fs;
namespace harness = engine::harness;
namespace json = nlohmann;
namespace process = utils::process;
namespace text = utils::text;

using utils::none;
using utils::optional;


/// Warning attached to the results of the host executor.
const char* const engine::degraded_warning =
    "Code was executed on the host without container isolation";


/// Strips the environment of variables that alter the host interpreters.
///
/// The interpreters inherit the environment of this process, so settings such
/// as PYTHONSTARTUP or PYTHONINSPECT would otherwise run code outside of the
/// harness or keep the interpreter alive after the script ends.  This must
/// be called before any thread is spawned.
void
engine::isolate_environment(void)
{
    std::vector< std::string > names;
    for (char** iter = environ; *iter != NULL; ++iter) {
        const std::string entry(*iter);
        const std::string name = entry.substr(0, entry.find('='));
        if (text::starts_with(name, "PYTHON") || name == "NODE_OPTIONS")
            names.push_back(name);
    }

    for (std::vector< std::string >::const_iterator iter = names.begin();
         iter != names.end(); ++iter) {
        LD(F("Unsetting %s for the host interpreters") % *iter);
        utils::unsetenv(*iter);
    }
    utils::setenv("PYTHONDONTWRITEBYTECODE", "1");
}


namespace {


/// Reads an optional string field of a payload.
///
/// \param doc The payload.
/// \param key The name of the field.
///
/// \return The value of the field, or none if it is missing or null.
static optional< std::string >
get_optional_string(const json::json& doc, const char* key)
{
    const json::json::const_iterator iter = doc.find(key);
    if (iter == doc.end() || iter->is_null())
        return none;
    return utils::make_optional(iter->is_string() ?
                                iter->get< std::string >() : iter->dump());
}


/// Builds the result of a test case whose output could not be interpreted.
///
/// \param id Identifier of the test case.
/// \param test_case The test case that was run.
/// \param output The output of the invoker.
/// \param elapsed Time spent in the test case.
/// \param message Description of the problem.
///
/// \return The failed test result.
static model::test_result
broken_result(const int id, const model::test_case& test_case,
              const std::string& output, const datetime::delta& elapsed,
              const std::string& message)
{
    return model::test_result(id, test_case, false, json::json(), output, "",
                              elapsed, utils::make_optional(message));
}


/// Converts the payload printed by the invoker into a test result.
///
/// \param id Identifier of the test case.
/// \param test_case The test case that was run.
/// \param doc The payload; must be an object.
///
/// \return The test result.
///
/// \throw json::json::exception If any field has an invalid type.
static model::test_result
interpret_payload(const int id, const model::test_case& test_case,
                  const json::json& doc)
{
    const json::json actual = doc.value("output", json::json());
    const std::string stdout_text = doc.value("stdout", std::string());
    const std::string stderr_text = doc.value("stderr", std::string());
    const datetime::delta elapsed = datetime::delta::from_seconds(
        doc.value("execution_time", 0.0));

    if (doc.value("status", std::string()) != "success") {
        const optional< std::string > error = get_optional_string(doc,
                                                                  "error");
        return model::test_result(
            id, test_case, false, actual, stdout_text, stderr_text, elapsed,
            utils::make_optional(error.get_default(
                "Invocation failed without a message")),
            get_optional_string(doc, "traceback"));
    }

    if (engine::equal(actual, test_case.expected_output())) {
        return model::test_result(id, test_case, true, actual, stdout_text,
                                  stderr_text, elapsed);
    } else {
        const std::string message = F("Expected %s, but got %s") %
            test_case.expected_output().dump() % actual.dump();
        return model::test_result(id, test_case, false, actual, stdout_text,
                                  stderr_text, elapsed,
                                  utils::make_optional(message));
    }
}


/// Converts the output of the invoker into a test result.
///
/// \param id Identifier of the test case.
/// \param test_case The test case that was run.
/// \param output The output of the invoker.
///
/// \return The test result.
static model::test_result
compute_result(const int id, const model::test_case& test_case,
               const std::string& output)
{
    const optional< std::string > payload = engine::find_payload(output);
    if (!payload)
        return broken_result(id, test_case, output, datetime::delta(),
                             "Failed to parse execution results");

    json::json doc;
    try {
        doc = json::json::parse(payload.get());
    } catch (const json::json::exception& e) {
        return broken_result(id, test_case, output, datetime::delta(),
                             F("Failed to parse execution results: %s") %
                             e.what());
    }
    if (!doc.is_object())
        return broken_result(id, test_case, output, datetime::delta(),
                             "Failed to parse execution results");

    try {
        return interpret_payload(id, test_case, doc);
    } catch (const json::json::exception& e) {
        return broken_result(id, test_case, output, datetime::delta(),
                             F("Invalid execution results: %s") % e.what());
    }
}


}  // anonymous namespace


/// Internal implementation of the host executor.
struct engine::host_executor::impl : utils::noncopyable {
    /// Configuration of the engine.
    const config settings;

    /// Constructor.
    ///
    /// \param settings_ Configuration of the engine.
    explicit impl(const config& settings_) :
        settings(settings_)
    {
    }

    /// Runs every test case of a request in a prepared workspace.
    ///
    /// \param interpreter Path to the Python interpreter.
    /// \param workspace Workspace containing the code and the invoker.
    /// \param request The request to run.
    ///
    /// \return The results of the test cases.
    ///
    /// \throw std::runtime_error If the input of a test cannot be written.
    /// \throw process::error If the interpreter cannot be spawned.
    model::test_results_vector
    run_tests(const fs::path& interpreter, const fs::path& workspace,
              const model::execution_request& request) const
    {
        process::args_vector args;
        args.push_back(harness::invoker_file);

        model::test_results_vector results;
        const model::test_cases_vector& test_cases = request.test_cases();
        for (model::test_cases_vector::size_type i = 0; i < test_cases.size();
             ++i) {
            const int id = static_cast< int >(i) + 1;
            const model::test_case& test_case = test_cases[i];
            utils::write_file(workspace / harness::input_file,
                              test_case.input().dump());

            const executor::exit_handle handle = executor::run(
                interpreter, args, settings.host_timeout,
                utils::make_optional(workspace));
            if (handle.timed_out()) {
                LI(F("Test case %s timed out") % id);
                results.push_back(broken_result(
                    id, test_case, handle.output(), settings.host_timeout,
                    F("Execution timed out after %s seconds") %
                    settings.host_timeout.to_seconds()));
            } else {
                results.push_back(compute_result(id, test_case,
                                                 handle.output()));
            }
        }
        return results;
    }
};


/// Constructor.
///
/// \param settings Configuration of the engine.
engine::host_executor::host_executor(const config& settings) :
    _pimpl(new impl(settings))
{
    isolate_environment();
}


/// Destructor.
engine::host_executor::~host_executor(void)
{
}


/// \return The name of the backend.
const char*
engine::host_executor::name(void) const
{
    return "host";
}


/// Checks if the backend can run code of a given language.
///
/// \param language The language to check.
///
/// \return True only for Python, which is the only host interpreter used.
bool
engine::host_executor::supports(const model::language language) const
{
    return language == model::language_python;
}


/// Runs a request on the host.
///
/// \param request The request to run.
///
/// \return The result of the execution, with a warning about the lack of
/// isolation.
model::execution_result
engine::host_executor::execute(const model::execution_request& request)
{
    if (!supports(request.language()))
        return model::execution_result::make_error(
            model::fault_validation,
            F("Legacy execution not supported for language: %s") %
            model::language_name(request.language()));

    std::string entry_point;
    try {
        entry_point = entry_point_for(request);
    } catch (const engine::error& e) {
        return model::execution_result::make_error(
            F("Could not identify a function to test: %s") % e.what());
    }

    const optional< fs::path > interpreter = fs::find_program(
        _pimpl->settings.host_python);
    if (!interpreter)
        return model::execution_result::make_error(
            model::fault_environment,
            F("Cannot find %s in the PATH") % _pimpl->settings.host_python);

    LW(F("Running %s code on the host without isolation") %
       model::language_name(request.language()));

    model::test_results_vector results;
    try {
        fs::auto_directory workspace(_pimpl->settings.work_directory,
                                     PACKAGE_TARNAME);
        utils::write_file(workspace / harness::code_file(request.language()),
                          request.code());
        utils::write_file(workspace / harness::invoker_file,
                          harness::invoker_script(entry_point));

        results = _pimpl->run_tests(interpreter.get(), workspace.directory(),
                                    request);
    } catch (const process::error& e) {
        return model::execution_result::make_error(
            model::fault_environment,
            F("Failed to run %s: %s") % interpreter.get() % e.what());
    } catch (const std::runtime_error& e) {
        return model::execution_result::make_error(
            model::fault_environment,
            F("Failed to prepare workspace: %s") % e.what());
    }

    datetime::delta elapsed;
    for (model::test_results_vector::const_iterator iter = results.begin();
         iter != results.end(); ++iter)
        elapsed += (*iter).elapsed();

    model::execution_result result = model::execution_result::make_success(
        results, elapsed);
    result.add_warning(degraded_warning);
    return result;
}


/// Runs a program on the host, feeding it its input through stdin.
///
/// \param request The program to run.
///
/// \return The outcome of the program, with a warning about the lack of
/// isolation.
model::program_result
engine::host_executor::run_program(const model::program_request& request)
{
    if (!supports(request.language()))
        return model::program_result::make_error(
            model::fault_validation,
            F("Legacy execution not supported for language: %s") %
            model::language_name(request.language()));

    const optional< fs::path > interpreter = fs::find_program(
        _pimpl->settings.host_python);
    if (!interpreter)
        return model::program_result::make_error(
            model::fault_environment,
            F("Cannot find %s in the PATH") % _pimpl->settings.host_python);

    LW(F("Running %s program on the host without isolation") %
       model::language_name(request.language()));

    process::args_vector args;
    args.push_back(harness::runner_file(request.language()));

    model::program_result result = model::program_result::make_error(
        model::fault_environment, "Program did not run");
    try {
        fs::auto_directory workspace(_pimpl->settings.work_directory,
                                     PACKAGE_TARNAME);
        harness::write_program_workspace(workspace.directory(), request);

        const executor::exit_handle handle = executor::run(
            interpreter.get(), args, _pimpl->settings.host_timeout,
            utils::make_optional(workspace.directory()));
        if (handle.timed_out()) {
            result = model::program_result::make_timeout(
                F("Execution timed out after %s seconds") %
                _pimpl->settings.host_timeout.to_seconds(),
                _pimpl->settings.host_timeout);
        } else {
            result = extract_program_result(handle.output());
        }
    } catch (const process::error& e) {
        return model::program_result::make_error(
            model::fault_environment,
            F("Failed to run %s: %s") % interpreter.get() % e.what());
    } catch (const std::runtime_error& e) {
        return model::program_result::make_error(
            model::fault_environment,
            F("Failed to prepare workspace: %s") % e.what());
    }

    result.add_warning(degraded_warning);
    return result;
}


/// Does nothing; every execution releases its own resources.
void
engine::host_executor::cleanup(void)
{
}
