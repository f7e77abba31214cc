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

#include "cli/cmd_run.hpp"

#include <cstdlib>

#include "engine/evaluator.hpp"
#include "model/exceptions.hpp"
#include "model/json.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/stream.hpp"

namespace cmdline = utils::cmdline;
namespace fs = utils::fs;
namespace json = nlohmann;

using cli::cmd_run;
using utils::optional;


namespace {


/// Constructs the request described by the command line.
///
/// \param cmdline The parsed command line.
/// \param config The runtime configuration of the program.
///
/// \return The request to run.
///
/// \throw cmdline::usage_error If any of the options is invalid.
/// \throw model::format_error If the test cases are invalid.
static model::execution_request
build_request(const cmdline::parsed_cmdline& cmdline,
              const engine::config& config)
{
    const fs::path code_file(cmdline.arguments()[0]);
    const fs::path tests_file(cmdline.arguments()[1]);

    model::language language = model::language_python;
    model::resource_limits limits;
    optional< std::string > entry_point;
    try {
        if (cmdline.has_option("language"))
            language = model::language_from_name(
                cmdline.get_option< cmdline::string_option >("language"));
        else
            language = cli::guess_language(code_file);
        limits = cli::parse_limits(cmdline, config.limits);
        if (cmdline.has_option("entry-point"))
            entry_point = cmdline.get_option< cmdline::string_option >(
                "entry-point");
    } catch (const model::format_error& e) {
        throw cmdline::usage_error(e.what());
    }

    json::json tests = cli::read_json(tests_file);
    if (tests.is_object() && tests.count("test_cases") > 0)
        tests = tests["test_cases"];

    const model::test_cases_vector test_cases = model::test_cases_from_json(
        tests);
    try {
        return model::execution_request(language, utils::read_file(code_file),
                                         test_cases, entry_point, limits);
    } catch (const model::format_error& e) {
        throw cmdline::usage_error(e.what());
    }
}


}  // anonymous namespace


/// Default constructor for cmd_run.
cmd_run::cmd_run(void) : cli_command(
    "run", "code-file tests-file", 2, 2,
    "Runs code against a set of test cases")
{
    add_option(cmdline::string_option(
        'l', "language", "Language of the code; guessed from the file name "
        "if not given", "name"));
    add_option(cmdline::string_option(
        'e', "entry-point", "Name of the function to test; located "
        "automatically if not given", "name"));
    add_option(cmdline::double_option(
        "timeout", "Wall-clock limit for the execution, in seconds", "secs"));
    add_option(cmdline::string_option(
        "memory", "Memory limit, with an optional k, m or g suffix", "size"));
    add_option(cmdline::double_option(
        "cpus", "Share of processor time, in cores", "count"));
    add_option(cmdline::bool_option(
        "network", "Allow the code to access the network"));
}


/// Entry point for the "run" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param config The runtime configuration of the program.
///
/// \return 0 if the execution succeeded and all tests passed, 1 otherwise.
int
cmd_run::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
             const engine::config& config)
{
    const model::execution_request request = build_request(cmdline, config);

    engine::evaluator evaluator(cli::make_backend(config),
                                config.safety_check);
    const model::execution_result result = evaluator.evaluate(request);
    evaluator.cleanup();

    cli::write_json(ui, model::result_to_json(result));
    for (std::vector< std::string >::const_iterator iter =
             result.warnings().begin(); iter != result.warnings().end();
         ++iter)
        cmdline::print_warning(ui, *iter);

    return (result.status() == model::status_success && result.all_passed()) ?
        EXIT_SUCCESS : EXIT_FAILURE;
}
