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

#include "cli/main.hpp"

#include <cstdlib>
#include <stdexcept>

#include <atf-c++.hpp>

#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/globals.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/cmdline/ui_mock.hpp"
#include "utils/datetime.hpp"
#include "utils/defs.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"

namespace cmdline = utils::cmdline;
namespace datetime = utils::datetime;
namespace fs = utils::fs;


namespace {


/// Mock command that raises an error.
class cmd_mock_error : public cli::cli_command {
    /// Whether the error is a logic error or a runtime error.
    bool _unhandled;

public:
    /// Constructor.
    ///
    /// \param unhandled Whether to raise an error that main() does not
    ///     handle.
    cmd_mock_error(const bool unhandled) :
        cli::cli_command("mock_error", "", 0, 0,
                         "Mock command that raises an error"),
        _unhandled(unhandled)
    {
    }

    int
    run(cmdline::ui* UTILS_UNUSED_PARAM(ui),
        const cmdline::parsed_cmdline& UTILS_UNUSED_PARAM(cmdline),
        const engine::config& UTILS_UNUSED_PARAM(config))
    {
        if (_unhandled)
            throw std::logic_error("This is unhandled");
        else
            throw std::runtime_error("Runtime error");
    }
};


/// Mock command that prints output.
class cmd_mock_write : public cli::cli_command {
public:
    cmd_mock_write(void) : cli::cli_command(
        "mock_write", "", 0, 0, "Mock command that prints output")
    {
    }

    int
    run(cmdline::ui* ui,
        const cmdline::parsed_cmdline& UTILS_UNUSED_PARAM(cmdline),
        const engine::config& UTILS_UNUSED_PARAM(config))
    {
        ui->out("stdout message from subcommand");
        ui->err("stderr message from subcommand");
        return 98;
    }
};


/// Mock command that prints some of the configuration it receives.
class cmd_mock_config : public cli::cli_command {
public:
    cmd_mock_config(void) : cli::cli_command(
        "mock_config", "", 0, 0, "Mock command that prints configuration")
    {
    }

    int
    run(cmdline::ui* ui,
        const cmdline::parsed_cmdline& UTILS_UNUSED_PARAM(cmdline),
        const engine::config& config)
    {
        ui->out(F("parallelism = %s") % config.parallelism);
        ui->out(F("python_image = %s") % config.python_image);
        return EXIT_SUCCESS;
    }
};


/// Runs the mock_config command with a given command line.
///
/// \param argc The number of arguments in argv.
/// \param argv The command line, which must select the mock_config command.
/// \param ui The object to capture the output.
///
/// \return The exit code of the program.
static int
run_mock_config(const int argc, const char* const* const argv,
                cmdline::ui_mock& ui)
{
    cmdline::init("progname");
    return cli::main(&ui, argc, argv,
                     cli::cli_command_ptr(new cmd_mock_config()));
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(detail__default_log_name__home);
ATF_TEST_CASE_BODY(detail__default_log_name__home)
{
    datetime::set_mock_now(datetime::timestamp::from_values(
        2011, 2, 21, 21, 10, 30, 0));
    cmdline::init("progname1");

    utils::setenv("HOME", "/home//fake");
    utils::setenv("TMPDIR", "/do/not/use/this");
    ATF_REQUIRE_EQ(
        fs::path("/home/fake/.corral/logs/progname1.20110221-211030.log"),
        cli::detail::default_log_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(detail__default_log_name__tmpdir);
ATF_TEST_CASE_BODY(detail__default_log_name__tmpdir)
{
    datetime::set_mock_now(datetime::timestamp::from_values(
        2011, 2, 21, 21, 10, 50, 0));
    cmdline::init("progname2");

    utils::unsetenv("HOME");
    utils::setenv("TMPDIR", "/a/b//c");
    ATF_REQUIRE_EQ(fs::path("/a/b/c/progname2.20110221-211050.log"),
                   cli::detail::default_log_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(detail__default_log_name__hardcoded);
ATF_TEST_CASE_BODY(detail__default_log_name__hardcoded)
{
    datetime::set_mock_now(datetime::timestamp::from_values(
        2011, 2, 21, 21, 15, 0, 0));
    cmdline::init("progname3");

    utils::unsetenv("HOME");
    utils::unsetenv("TMPDIR");
    ATF_REQUIRE_EQ(fs::path("/tmp/progname3.20110221-211500.log"),
                   cli::detail::default_log_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(main__no_args);
ATF_TEST_CASE_BODY(main__no_args)
{
    cmdline::init("progname");

    const int argc = 2;
    const char* const argv[] = {"progname", "--logfile=test.log", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_FAILURE, cli::main(&ui, argc, argv));
    ATF_REQUIRE(ui.out_log().empty());
    ATF_REQUIRE(atf::utils::grep_collection("Usage error: No command provided",
                                            ui.err_log()));
    ATF_REQUIRE(atf::utils::grep_collection("Type.*progname help",
                                            ui.err_log()));
}


ATF_TEST_CASE_WITHOUT_HEAD(main__unknown_command);
ATF_TEST_CASE_BODY(main__unknown_command)
{
    cmdline::init("progname");

    const int argc = 3;
    const char* const argv[] = {"progname", "--logfile=test.log", "foo", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_FAILURE, cli::main(&ui, argc, argv));
    ATF_REQUIRE(ui.out_log().empty());
    ATF_REQUIRE(atf::utils::grep_collection("Usage error: Unknown command.*foo",
                                            ui.err_log()));
    ATF_REQUIRE(atf::utils::grep_collection("Type.*progname help",
                                            ui.err_log()));
}


ATF_TEST_CASE_WITHOUT_HEAD(main__logfile__default);
ATF_TEST_CASE_BODY(main__logfile__default)
{
    datetime::set_mock_now(datetime::timestamp::from_values(
        2011, 2, 21, 21, 30, 0, 0));
    cmdline::init("progname");
    utils::setenv("HOME", fs::current_path().str());

    const int argc = 1;
    const char* const argv[] = {"progname", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE(!fs::exists(fs::path(
        ".corral/logs/progname.20110221-213000.log")));
    ATF_REQUIRE_EQ(EXIT_FAILURE, cli::main(&ui, argc, argv));
    ATF_REQUIRE(fs::exists(fs::path(
        ".corral/logs/progname.20110221-213000.log")));
}


ATF_TEST_CASE_WITHOUT_HEAD(main__logfile__override);
ATF_TEST_CASE_BODY(main__logfile__override)
{
    datetime::set_mock_now(datetime::timestamp::from_values(
        2011, 2, 21, 21, 30, 0, 0));
    cmdline::init("progname");
    utils::setenv("HOME", fs::current_path().str());

    const int argc = 2;
    const char* const argv[] = {"progname", "--logfile=test.log", NULL};

    LI("Mock info message");

    cmdline::ui_mock ui;
    ATF_REQUIRE(!fs::exists(fs::path("test.log")));
    ATF_REQUIRE_EQ(EXIT_FAILURE, cli::main(&ui, argc, argv));
    ATF_REQUIRE(!fs::exists(fs::path(
        ".corral/logs/progname.20110221-213000.log")));
    ATF_REQUIRE(fs::exists(fs::path("test.log")));
    ATF_REQUIRE(atf::utils::grep_file("Mock info message", "test.log"));
    ATF_REQUIRE(atf::utils::grep_file("No command provided", "test.log"));
}


ATF_TEST_CASE_WITHOUT_HEAD(main__subcommand__ok);
ATF_TEST_CASE_BODY(main__subcommand__ok)
{
    cmdline::init("progname");

    const int argc = 3;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "mock_write", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(98, cli::main(&ui, argc, argv,
                                 cli::cli_command_ptr(new cmd_mock_write())));
    ATF_REQUIRE_EQ(1, ui.out_log().size());
    ATF_REQUIRE_EQ("stdout message from subcommand", ui.out_log()[0]);
    ATF_REQUIRE_EQ(1, ui.err_log().size());
    ATF_REQUIRE_EQ("stderr message from subcommand", ui.err_log()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(main__subcommand__invalid_args);
ATF_TEST_CASE_BODY(main__subcommand__invalid_args)
{
    cmdline::init("progname");

    const int argc = 4;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "mock_write", "bar", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_FAILURE,
                   cli::main(&ui, argc, argv,
                             cli::cli_command_ptr(new cmd_mock_write())));
    ATF_REQUIRE(ui.out_log().empty());
    ATF_REQUIRE(atf::utils::grep_collection(
        "Usage error for command mock_write: Too many arguments.",
        ui.err_log()));
    ATF_REQUIRE(atf::utils::grep_collection("Type.*progname help",
                                            ui.err_log()));
}


ATF_TEST_CASE_WITHOUT_HEAD(main__subcommand__runtime_error);
ATF_TEST_CASE_BODY(main__subcommand__runtime_error)
{
    cmdline::init("progname");

    const int argc = 3;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "mock_error", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_FAILURE, cli::main(&ui, argc, argv,
        cli::cli_command_ptr(new cmd_mock_error(false))));
    ATF_REQUIRE(ui.out_log().empty());
    ATF_REQUIRE(atf::utils::grep_collection("progname: E: Runtime error.",
                                            ui.err_log()));
}


ATF_TEST_CASE_WITHOUT_HEAD(main__subcommand__unhandled_exception);
ATF_TEST_CASE_BODY(main__subcommand__unhandled_exception)
{
    cmdline::init("progname");

    const int argc = 3;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "mock_error", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW(std::logic_error, cli::main(&ui, argc, argv,
        cli::cli_command_ptr(new cmd_mock_error(true))));
}


ATF_TEST_CASE_WITHOUT_HEAD(main__config__defaults);
ATF_TEST_CASE_BODY(main__config__defaults)
{
    utils::setenv("HOME", fs::current_path().str());

    const int argc = 3;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "mock_config", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_mock_config(argc, argv, ui));
    ATF_REQUIRE_EQ(2, ui.out_log().size());
    ATF_REQUIRE_EQ("parallelism = 4", ui.out_log()[0]);
    ATF_REQUIRE_EQ("python_image = python:3.11-slim", ui.out_log()[1]);
}


ATF_TEST_CASE_WITHOUT_HEAD(main__config__user_file);
ATF_TEST_CASE_BODY(main__config__user_file)
{
    utils::setenv("HOME", fs::current_path().str());
    fs::mkdir(fs::path(".corral"), 0755);
    atf::utils::create_file(".corral/corral.conf",
                            "syntax('config', 1)\nparallelism = 2\n");

    const int argc = 3;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "mock_config", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_mock_config(argc, argv, ui));
    ATF_REQUIRE_EQ("parallelism = 2", ui.out_log()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(main__config__explicit_file);
ATF_TEST_CASE_BODY(main__config__explicit_file)
{
    utils::setenv("HOME", fs::current_path().str());
    fs::mkdir(fs::path(".corral"), 0755);
    atf::utils::create_file(".corral/corral.conf",
                            "syntax('config', 1)\nparallelism = 2\n");
    atf::utils::create_file("custom.conf",
                            "syntax('config', 1)\n"
                            "python_image = 'python:3.12'\n");

    const int argc = 4;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "--config=custom.conf", "mock_config", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_mock_config(argc, argv, ui));
    ATF_REQUIRE_EQ("parallelism = 4", ui.out_log()[0]);
    ATF_REQUIRE_EQ("python_image = python:3.12", ui.out_log()[1]);
}


ATF_TEST_CASE_WITHOUT_HEAD(main__config__none);
ATF_TEST_CASE_BODY(main__config__none)
{
    utils::setenv("HOME", fs::current_path().str());
    fs::mkdir(fs::path(".corral"), 0755);
    atf::utils::create_file(".corral/corral.conf",
                            "syntax('config', 1)\nparallelism = 2\n");

    const int argc = 4;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "--config=none", "mock_config", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_mock_config(argc, argv, ui));
    ATF_REQUIRE_EQ("parallelism = 4", ui.out_log()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(main__config__invalid_file);
ATF_TEST_CASE_BODY(main__config__invalid_file)
{
    atf::utils::create_file("custom.conf", "parallelism = 2\n");

    const int argc = 4;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "--config=custom.conf", "mock_config", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_FAILURE, run_mock_config(argc, argv, ui));
    ATF_REQUIRE(ui.out_log().empty());
    ATF_REQUIRE(atf::utils::grep_collection(
        "progname: E: .*custom.conf.*Syntax not defined", ui.err_log()));
}


ATF_TEST_CASE_WITHOUT_HEAD(main__config__overrides);
ATF_TEST_CASE_BODY(main__config__overrides)
{
    const int argc = 6;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "--config=none", "-v", "parallelism=7",
                                "mock_config", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, run_mock_config(argc, argv, ui));
    ATF_REQUIRE_EQ("parallelism = 7", ui.out_log()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(main__config__invalid_override);
ATF_TEST_CASE_BODY(main__config__invalid_override)
{
    const int argc = 5;
    const char* const argv[] = {"progname", "--logfile=test.log",
                                "--variable=foo=bar", "mock_config", NULL};

    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_FAILURE, run_mock_config(argc, argv, ui));
    ATF_REQUIRE(ui.out_log().empty());
    ATF_REQUIRE(atf::utils::grep_collection(
        "Usage error: Unrecognized configuration property 'foo'",
        ui.err_log()));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, detail__default_log_name__home);
    ATF_ADD_TEST_CASE(tcs, detail__default_log_name__tmpdir);
    ATF_ADD_TEST_CASE(tcs, detail__default_log_name__hardcoded);

    ATF_ADD_TEST_CASE(tcs, main__no_args);
    ATF_ADD_TEST_CASE(tcs, main__unknown_command);
    ATF_ADD_TEST_CASE(tcs, main__logfile__default);
    ATF_ADD_TEST_CASE(tcs, main__logfile__override);
    ATF_ADD_TEST_CASE(tcs, main__subcommand__ok);
    ATF_ADD_TEST_CASE(tcs, main__subcommand__invalid_args);
    ATF_ADD_TEST_CASE(tcs, main__subcommand__runtime_error);
    ATF_ADD_TEST_CASE(tcs, main__subcommand__unhandled_exception);

    ATF_ADD_TEST_CASE(tcs, main__config__defaults);
    ATF_ADD_TEST_CASE(tcs, main__config__user_file);
    ATF_ADD_TEST_CASE(tcs, main__config__explicit_file);
    ATF_ADD_TEST_CASE(tcs, main__config__none);
    ATF_ADD_TEST_CASE(tcs, main__config__invalid_file);
    ATF_ADD_TEST_CASE(tcs, main__config__overrides);
    ATF_ADD_TEST_CASE(tcs, main__config__invalid_override);
}
