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

#include "cli/cmd_batch.hpp"

#include <cstdlib>
#include <future>
#include <vector>

#include "engine/evaluator.hpp"
#include "engine/scheduler.hpp"
#include "model/json.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"

namespace cmdline = utils::cmdline;
namespace fs = utils::fs;
namespace json = nlohmann;

using cli::cmd_batch;


namespace {


/// Collection of pending results, in submission order.
typedef std::vector< std::future< model::execution_result > > futures_vector;


}  // anonymous namespace


/// Default constructor for cmd_batch.
cmd_batch::cmd_batch(void) : cli_command(
    "batch", "requests-file", 1, 1,
    "Runs a collection of requests concurrently")
{
}


/// Entry point for the "batch" subcommand.
///
/// \param ui Object to interact with the I/O of the program.
/// \param cmdline Representation of the command line to the subcommand.
/// \param config The runtime configuration of the program.
///
/// \return 0 if all the requests succeeded and all their tests passed, 1
/// otherwise.
int
cmd_batch::run(cmdline::ui* ui, const cmdline::parsed_cmdline& cmdline,
               const engine::config& config)
{
    const std::vector< model::execution_request > requests =
        model::requests_from_json(
            cli::read_json(fs::path(cmdline.arguments()[0])), config.limits);
    LI(F("Loaded %s requests") % requests.size());

    engine::scheduler scheduler(
        engine::evaluator(cli::make_backend(config), config.safety_check),
        config.parallelism);

    futures_vector futures;
    for (std::vector< model::execution_request >::const_iterator iter =
             requests.begin(); iter != requests.end(); ++iter)
        futures.push_back(scheduler.submit(*iter));

    bool good = true;
    json::json results = json::json::array();
    for (futures_vector::iterator iter = futures.begin();
         iter != futures.end(); ++iter) {
        const model::execution_result result = (*iter).get();
        if (result.status() != model::status_success || !result.all_passed())
            good = false;
        results.push_back(model::result_to_json(result));
    }
    scheduler.cleanup();

    cli::write_json(ui, results);
    return good ? EXIT_SUCCESS : EXIT_FAILURE;
}
