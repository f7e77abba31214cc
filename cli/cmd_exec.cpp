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

#include "cli/cmd_exec.hpp"

#include <cstdlib>

#include "engine/evaluator.hpp"
#include "model/exceptions.hpp"
#include "model/json.hpp"
#include "model/program.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/cmdline/ui.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/stream.hpp"

namespace cmdline = utils::cmdline;
namespace fs = utils::fs;

using cli::cmd_exec;


namespace {


/// Constructs the program run described by the command line.
///
/// \param cmdline The parsed command line.
/// \param config The runtime configuration of the program.
///
/// \return The program to run.
///
/// \throw cmdline::usage_error If any of the options is invalid.
static model::program_request
build_request(const cmdline::parsed_cmdline& cmdline,
              const engine::config& config)
{
    const fs::path code_file(cmdline.arguments()[0]);

    model::language language = model::language_python;
    model::resource_limits limits;
    try {
        if (cmdline.has_option("language"))
            language = model::language_from_name(
                cmdline.get_option< cmdline::string_option >("language"));
        else
            language = cli::guess_language(code_file);
        limits = cli::parse_limits(cmdline, config.limits);
    } catch (const model::format_error& e) {
        throw cmdline::usage_error(e.what());
    }

    std::string input;
    if (cmdline.arguments().size() > 1) {
        const fs::path input_file(cmdline.arguments()[1]);
        LD(F("Reading program input from %s") % input_file);
        input = utils::read_file(input_file);
    }

    return model::program_request(language, utils::read_file(code_file),
                                  input, limits);
}


}  // anonymous namespace


/// Default constructor for cmd_exec.
cmd_exec::cmd_exec(void) : cli_command(
    "exec", "code-file [input-file]", 1, 2,
    "Runs a program with the contents of a file as its standard input")
{
    add_option(cmdline::string_option(
        'l', "language", "Language of the code; guessed from the file name "
        "if not given", "name"));
    add_option(cmdline::double_option(
        "timeout", "Wall-clock limit for the execution, in seconds", "secs"));
    add_option(cmdline::string_option(
        "memory", "Memory limit, with an optional k, m or g suffix", "size"));
    add_option(cmdline::double_option(
        "cpus", "Share of processor time, in cores", "count"));
    add_option(cmdline::bool_option(
        "network", "Allow the code to access the network"));
}


/// Entry point for the "exec" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param config The runtime configuration of the program.
///
/// \return 0 if the program ran to completion cleanly, 1 otherwise.
int
cmd_exec::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
              const engine::config& config)
{
    const model::program_request request = build_request(cmdline, config);

    engine::evaluator evaluator(cli::make_backend(config),
                                config.safety_check);
    const model::program_result result = evaluator.run_program(request);
    evaluator.cleanup();

    cli::write_json(ui, model::program_result_to_json(result));
    for (std::vector< std::string >::const_iterator iter =
             result.warnings().begin(); iter != result.warnings().end();
         ++iter)
        cmdline::print_warning(ui, *iter);

    return result.status() == model::status_success ?
        EXIT_SUCCESS : EXIT_FAILURE;
}
