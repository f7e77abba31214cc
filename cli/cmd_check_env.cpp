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

#include "cli/cmd_check_env.hpp"

#include <cstdlib>

#include "engine/docker_runtime.hpp"
#include "engine/exceptions.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui.hpp"
#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/optional.ipp"

namespace cmdline = utils::cmdline;
namespace fs = utils::fs;

using cli::cmd_check_env;
using utils::optional;


/// Default constructor for cmd_check_env.
cmd_check_env::cmd_check_env(void) : cli_command(
    "check-env", "", 0, 0,
    "Reports the availability of the execution backends")
{
}


/// Entry point for the "check-env" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param unused_cmdline Representation of the command line to the subcommand.
/// \param config The runtime configuration of the program.
///
/// \return 0 if the configured backend can be used, 1 otherwise.
int
cmd_check_env::run(cmdline::ui* ui,
                   const cmdline::parsed_cmdline& UTILS_UNUSED_PARAM(cmdline),
                   const engine::config& config)
{
    std::shared_ptr< engine::container_runtime > runtime(
        new engine::docker_runtime(config.docker, config.docker_timeout));

    const std::string problem = engine::check_requirements(*runtime);
    if (problem.empty())
        ui->out(F("Container runtime: available (%s)") % config.docker);
    else
        ui->out(F("Container runtime: unavailable (%s)") % problem);

    const optional< fs::path > python = fs::find_program(
        config.host_python);
    if (python)
        ui->out(F("Host interpreter: %s") % python.get());
    else
        ui->out(F("Host interpreter: %s not found") % config.host_python);

    try {
        const std::shared_ptr< engine::backend > backend =
            engine::setup_backend(config, runtime);
        ui->out(F("Selected backend: %s") % backend->name());
    } catch (const engine::error& e) {
        cmdline::print_error(ui, e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
