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

#include "cli/cmd_help.hpp"

#include <cstdlib>

#include <atf-c++.hpp>

#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/commands_map.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/globals.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui_mock.hpp"
#include "utils/defs.hpp"

namespace cmdline = utils::cmdline;

using cli::cmd_help;


namespace {


/// Mock command with options and arguments.
class cmd_mock : public cli::cli_command {
public:
    cmd_mock(void) : cli::cli_command(
        "mock", "arg1 [arg2]", 1, 2, "Does something mocked")
    {
        add_option(cmdline::bool_option('b', "flag", "A boolean flag"));
        add_option(cmdline::string_option("name", "A named value", "text",
                                          "foo"));
    }

    int
    run(cmdline::ui* UTILS_UNUSED_PARAM(ui),
        const cmdline::parsed_cmdline& UTILS_UNUSED_PARAM(cmdline),
        const engine::config& UTILS_UNUSED_PARAM(config))
    {
        return EXIT_SUCCESS;
    }
};


/// Mock command with no options nor arguments.
class cmd_plain : public cli::cli_command {
public:
    cmd_plain(void) : cli::cli_command(
        "plain", "", 0, 0, "Does nothing")
    {
    }

    int
    run(cmdline::ui* UTILS_UNUSED_PARAM(ui),
        const cmdline::parsed_cmdline& UTILS_UNUSED_PARAM(cmdline),
        const engine::config& UTILS_UNUSED_PARAM(config))
    {
        return EXIT_SUCCESS;
    }
};


/// Program-wide options used by the tests.
static const cmdline::bool_option global_option('g', "global",
                                                "A global option");


/// Runs the help command.
///
/// \param argument The name of the command to describe, or empty for the
///     general help.
/// \param ui The object to capture the output.
///
/// \return The exit code of the command.
static int
run_help(const std::string& argument, cmdline::ui_mock& ui)
{
    cmdline::init("progname");

    cmdline::options_vector options;
    options.push_back(&global_option);

    cli::commands_map commands;
    commands.insert(new cmd_mock());
    commands.insert(new cmd_plain());

    cmdline::args_vector args;
    args.push_back("help");
    if (!argument.empty())
        args.push_back(argument);

    cmd_help cmd(&options, &commands);
    return cmd.main(&ui, args, engine::config());
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(general);
ATF_TEST_CASE_BODY(general)
{
    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_help("", ui));

    const std::vector< std::string >& out = ui.out_log();
    ATF_REQUIRE_EQ(12, out.size());
    ATF_REQUIRE_EQ("Usage: progname [general_options] command "
                   "[command_options] [args]", out[0]);
    ATF_REQUIRE_MATCH("^Evaluates candidate code", out[2]);
    ATF_REQUIRE_EQ("Available general options:", out[4]);
    ATF_REQUIRE_EQ("    -g, --global: A global option.", out[5]);
    ATF_REQUIRE_EQ("Available commands:", out[7]);
    ATF_REQUIRE_EQ("    mock:  Does something mocked.", out[8]);
    ATF_REQUIRE_EQ("    plain: Does nothing.", out[9]);
    ATF_REQUIRE_EQ("Type 'progname help command' for the usage of a "
                   "command.", out[11]);
    ATF_REQUIRE(ui.err_log().empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(subcommand__options);
ATF_TEST_CASE_BODY(subcommand__options)
{
    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_help("mock", ui));

    const std::vector< std::string >& out = ui.out_log();
    ATF_REQUIRE_EQ("Usage: progname [general_options] mock "
                   "[command_options] arg1 [arg2]", out[0]);
    ATF_REQUIRE_EQ("Does something mocked.", out[2]);
    ATF_REQUIRE(atf::utils::grep_collection("^Available command options:$",
                                            out));
    ATF_REQUIRE(atf::utils::grep_collection("^    -b, --flag: A boolean flag",
                                            out));
    ATF_REQUIRE(atf::utils::grep_collection(
        "^    --name=text: A named value \\(default: foo\\)", out));
}


ATF_TEST_CASE_WITHOUT_HEAD(subcommand__plain);
ATF_TEST_CASE_BODY(subcommand__plain)
{
    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_help("plain", ui));

    const std::vector< std::string >& out = ui.out_log();
    ATF_REQUIRE_EQ("Usage: progname [general_options] plain", out[0]);
    ATF_REQUIRE_EQ("Does nothing.", out[2]);
    ATF_REQUIRE(atf::utils::grep_collection("^Available general options:$",
                                            out));
    ATF_REQUIRE(!atf::utils::grep_collection("command options", out));
}


ATF_TEST_CASE_WITHOUT_HEAD(subcommand__unknown);
ATF_TEST_CASE_BODY(subcommand__unknown)
{
    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW_RE(cmdline::usage_error, "command foo does not exist",
                         run_help("foo", ui));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, general);
    ATF_ADD_TEST_CASE(tcs, subcommand__options);
    ATF_ADD_TEST_CASE(tcs, subcommand__plain);
    ATF_ADD_TEST_CASE(tcs, subcommand__unknown);
}
