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

/// \file cli/common.hpp
/// Utility functions to implement CLI subcommands.

#if !defined(CLI_COMMON_HPP)
#define CLI_COMMON_HPP

#include <memory>

#include <nlohmann/json.hpp>

#include "engine/backend.hpp"
#include "engine/config.hpp"
#include "model/language.hpp"
#include "model/resource_limits.hpp"
#include "utils/cmdline/base_command.hpp"
#include "utils/cmdline/commands_map.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui.hpp"
#include "utils/fs/path.hpp"

namespace cli {


extern const utils::cmdline::path_option config_option;
extern const utils::cmdline::property_option variable_option;


/// Base type for commands defined in the cli module.
///
/// All commands in Corral receive the runtime configuration as data.
typedef utils::cmdline::base_command< engine::config > cli_command;


/// Unique pointer to a cli_command.
typedef std::unique_ptr< cli_command > cli_command_ptr;


/// Collection of the commands of the program, indexed by name.
typedef utils::cmdline::commands_map< cli_command > commands_map;


engine::config load_config(const utils::cmdline::parsed_cmdline&);
model::language guess_language(const utils::fs::path&);
model::resource_limits parse_limits(const utils::cmdline::parsed_cmdline&,
                                    const model::resource_limits&);
nlohmann::json read_json(const utils::fs::path&);
std::shared_ptr< engine::backend > make_backend(const engine::config&);
void write_json(utils::cmdline::ui*, const nlohmann::json&);


}  // namespace cli

#endif  // !defined(CLI_COMMON_HPP)
