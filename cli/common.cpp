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

#include "cli/common.hpp"

#include "engine/docker_runtime.hpp"
#include "engine/exceptions.hpp"
#include "model/exceptions.hpp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/datetime.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/stream.hpp"

namespace cmdline = utils::cmdline;
namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace json = nlohmann;

using utils::optional;


/// Standard definition of the option to specify a configuration file.
///
/// The special value 'none' selects the built-in defaults.
const cmdline::path_option cli::config_option(
    'c', "config",
    "Path to the configuration file",
    "file");


/// Standard definition of the option to override configuration variables.
const cmdline::property_option cli::variable_option(
    'v', "variable",
    "Overrides a particular configuration variable",
    "K=V");


namespace {


/// Locates the configuration file to use when none is given explicitly.
///
/// \return The path to the user configuration file if it exists; none
/// otherwise.
static optional< fs::path >
find_user_config(void)
{
    const optional< std::string > home = utils::getenv("HOME");
    if (!home)
        return utils::none;

    const fs::path file = fs::path(home.get()) / ".corral" / "corral.conf";
    if (fs::exists(file))
        return utils::make_optional(file);
    LD(F("No configuration file at %s") % file);
    return utils::none;
}


}  // anonymous namespace


/// Loads the configuration requested by the user.
///
/// \param cmdline The parsed command line.
///
/// \return The loaded configuration with the command-line overrides applied.
///
/// \throw engine::load_error If the configuration file is invalid.
/// \throw cmdline::usage_error If any of the overrides is invalid.
engine::config
cli::load_config(const cmdline::parsed_cmdline& cmdline)
{
    engine::config config;
    if (cmdline.has_option(config_option.long_name())) {
        const fs::path file = cmdline.get_option< cmdline::path_option >(
            config_option.long_name());
        if (file.str() != "none")
            config = engine::config::load(file);
    } else {
        const optional< fs::path > file = find_user_config();
        if (file)
            config = engine::config::load(file.get());
    }

    try {
        return config.apply_overrides(
            cmdline.get_multi_option< cmdline::property_option >(
                variable_option.long_name()));
    } catch (const engine::error& e) {
        throw cmdline::usage_error(e.what());
    }
}


/// Reads and parses a JSON document.
///
/// \param file The file to read.
///
/// \return The parsed document.
///
/// \throw engine::format_error If the file does not contain valid JSON.
/// \throw std::runtime_error If the file cannot be read.
json::json
cli::read_json(const fs::path& file)
{
    const std::string contents = utils::read_file(file);
    try {
        return json::json::parse(contents);
    } catch (const json::json::parse_error& e) {
        throw engine::format_error(F("Invalid JSON in %s: %s") % file %
                                   e.what());
    }
}


/// Constructs the execution backend selected by the configuration.
///
/// \param config The runtime configuration.
///
/// \return The backend to run requests on.
///
/// \throw engine::error If the selected backend cannot be used.
std::shared_ptr< engine::backend >
cli::make_backend(const engine::config& config)
{
    std::shared_ptr< engine::container_runtime > runtime(
        new engine::docker_runtime(config.docker, config.docker_timeout));
    return engine::setup_backend(config, runtime);
}


/// Guesses the language of a source file from its name.
///
/// \param file The source file.
///
/// \return The language of the file; Python unless the extension says
/// otherwise.
model::language
cli::guess_language(const fs::path& file)
{
    const std::string name = file.leaf_name();
    const std::string::size_type dot = name.rfind('.');
    if (dot != std::string::npos) {
        const std::string extension = name.substr(dot + 1);
        if (extension == "js" || extension == "mjs" || extension == "cjs")
            return model::language_javascript;
    }
    return model::language_python;
}


/// Computes the resource limits requested on the command line.
///
/// \param cmdline The parsed command line.
/// \param defaults The limits to use for the values not given.
///
/// \return The resource limits.
///
/// \throw model::format_error If any of the values is invalid.
model::resource_limits
cli::parse_limits(const cmdline::parsed_cmdline& cmdline,
                  const model::resource_limits& defaults)
{
    uint64_t memory_bytes = defaults.memory_bytes();
    if (cmdline.has_option("memory"))
        memory_bytes = model::resource_limits::parse_memory(
            cmdline.get_option< cmdline::string_option >("memory"));

    double cpu_share = defaults.cpu_share();
    if (cmdline.has_option("cpus"))
        cpu_share = cmdline.get_option< cmdline::double_option >("cpus");

    datetime::delta timeout = defaults.timeout();
    if (cmdline.has_option("timeout"))
        timeout = datetime::delta::from_seconds(
            cmdline.get_option< cmdline::double_option >("timeout"));

    const bool network = defaults.network() ||
        cmdline.has_option("network");

    return model::resource_limits(memory_bytes, cpu_share, timeout, network);
}


/// Prints a JSON document to the standard output.
///
/// Strings in the document may carry arbitrary bytes produced by the executed
/// code; invalid UTF-8 sequences are printed as U+FFFD.
///
/// \param ui Object to interact with the I/O of the program.
/// \param doc The document to print.
void
cli::write_json(cmdline::ui* ui, const json::json& doc)
{
    ui->out(doc.dump(2, ' ', false, json::json::error_handler_t::replace));
}
