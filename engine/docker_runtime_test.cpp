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

#include "engine/docker_runtime.hpp"

extern "C" {
#include <sys/stat.h>
}

#include <atf-c++.hpp>

#include "engine/exceptions.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"
#include "utils/stream.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace process = utils::process;


namespace {


/// Script that mimics the docker client.
///
/// Every invocation is recorded in the calls.log file of the current
/// directory.
static const char* const fake_docker =
    "#! /bin/sh\n"
    "echo \"$*\" >>calls.log\n"
    "case \"$1\" in\n"
    "    version) echo ' 24.0.5 ' ;;\n"
    "    image)\n"
    "        if [ \"$5\" = missing:latest ]; then\n"
    "            echo \"Error: No such image: $5\" 1>&2\n"
    "            exit 1\n"
    "        fi\n"
    "        echo sha256:1234 ;;\n"
    "    create) echo 0123456789abcdef ;;\n"
    "    start) [ \"$2\" != broken ] || { echo 'Error: boom' 1>&2; exit 1; } ;;\n"
    "    wait)\n"
    "        [ \"$2\" != slow ] || sleep 10\n"
    "        echo 3 ;;\n"
    "    logs) echo 'line 1'; echo 'line 2' ;;\n"
    "    kill) echo \"$2\" ;;\n"
    "    rm)\n"
    "        case \"$3\" in\n"
    "            gone) echo \"Error: No such container: $3\" 1>&2; exit 1 ;;\n"
    "            stuck) echo 'Error: device or resource busy' 1>&2; exit 1 ;;\n"
    "        esac\n"
    "        echo \"$3\" ;;\n"
    "esac\n";


/// Creates the fake docker client in the current directory.
///
/// \return A runtime that uses the fake client.
static engine::docker_runtime
setup_runtime(void)
{
    const fs::path program = fs::current_path() / "docker";
    utils::write_file(program, fake_docker);
    ATF_REQUIRE(::chmod(program.c_str(), 0755) != -1);
    return engine::docker_runtime(program.str(), datetime::delta(30, 0));
}


/// Builds a container specification for the tests.
///
/// \param network Whether the container can access the network.
///
/// \return The specification.
static engine::container_spec
make_spec(const bool network)
{
    process::args_vector command;
    command.push_back("python");
    command.push_back("runner.py");
    return engine::container_spec(
        "corral-python-0badcafe", "python:3.11-slim", fs::path("/tmp/ws"),
        command, model::resource_limits(128 * 1024 * 1024, 0.5,
                                        datetime::delta(30, 0), network));
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(create_args__isolated);
ATF_TEST_CASE_BODY(create_args__isolated)
{
    const char* const exp[] = {
        "create", "--name", "corral-python-0badcafe",
        "--memory", "134217728", "--memory-swap", "134217728",
        "--cpu-period", "100000", "--cpu-quota", "50000",
        "--pids-limit", "64", "--network", "none",
        "--cap-drop", "ALL", "--security-opt", "no-new-privileges",
        "-v", "/tmp/ws:/app:rw", "-w", "/app",
        "python:3.11-slim", "python", "runner.py", NULL };
    process::args_vector exp_args;
    for (const char* const* iter = exp; *iter != NULL; ++iter)
        exp_args.push_back(*iter);

    ATF_REQUIRE(exp_args == engine::detail::create_args(
        make_spec(false), engine::detail::default_pids_limit));
}


ATF_TEST_CASE_WITHOUT_HEAD(create_args__network);
ATF_TEST_CASE_BODY(create_args__network)
{
    const process::args_vector args = engine::detail::create_args(
        make_spec(true), 16);
    for (process::args_vector::const_iterator iter = args.begin();
         iter != args.end(); ++iter)
        ATF_REQUIRE(*iter != "--network");
    ATF_REQUIRE_EQ("--pids-limit", args[11]);
    ATF_REQUIRE_EQ("16", args[12]);
}


ATF_TEST_CASE_WITHOUT_HEAD(version);
ATF_TEST_CASE_BODY(version)
{
    engine::docker_runtime runtime = setup_runtime();
    ATF_REQUIRE_EQ("24.0.5", runtime.version());
    ATF_REQUIRE_EQ("", engine::check_requirements(runtime));
}


ATF_TEST_CASE_WITHOUT_HEAD(missing_client);
ATF_TEST_CASE_BODY(missing_client)
{
    engine::docker_runtime runtime("corral-no-such-docker",
                                   datetime::delta(30, 0));
    ATF_REQUIRE_THROW_RE(engine::container_error,
                         "Cannot find corral-no-such-docker in the PATH",
                         runtime.version());
    ATF_REQUIRE_MATCH("Cannot find", engine::check_requirements(runtime));
}


ATF_TEST_CASE_WITHOUT_HEAD(lifecycle);
ATF_TEST_CASE_BODY(lifecycle)
{
    engine::docker_runtime runtime = setup_runtime();
    const engine::container_spec spec = make_spec(false);

    runtime.create(spec);
    runtime.start(spec.name);
    ATF_REQUIRE_EQ(3, runtime.wait(spec.name, datetime::delta(30, 0)).get());
    ATF_REQUIRE_EQ("line 1\nline 2\n", runtime.logs(spec.name));
    runtime.stop(spec.name);
    runtime.remove(spec.name);

    const std::string calls = utils::read_file(fs::path("calls.log"));
    ATF_REQUIRE_MATCH("^image inspect --format \\{\\{.Id\\}\\} "
                      "python:3.11-slim\n", calls);
    ATF_REQUIRE_MATCH("\ncreate --name corral-python-0badcafe .* "
                      "python:3.11-slim python runner.py\n", calls);
    ATF_REQUIRE_MATCH("\nstart corral-python-0badcafe\n"
                      "wait corral-python-0badcafe\n"
                      "logs corral-python-0badcafe\n"
                      "kill corral-python-0badcafe\n"
                      "rm --force corral-python-0badcafe\n$", calls);
}


ATF_TEST_CASE_WITHOUT_HEAD(create__image_not_found);
ATF_TEST_CASE_BODY(create__image_not_found)
{
    engine::docker_runtime runtime = setup_runtime();
    engine::container_spec spec = make_spec(false);
    spec.image = "missing:latest";

    try {
        runtime.create(spec);
        ATF_FAIL("image_not_found_error not raised");
    } catch (const engine::image_not_found_error& e) {
        ATF_REQUIRE_EQ("missing:latest", e.image());
        ATF_REQUIRE_EQ(std::string("Docker image not found: missing:latest"),
                       e.what());
    }
    ATF_REQUIRE(utils::read_file(fs::path("calls.log")).find("create") ==
                std::string::npos);
}


ATF_TEST_CASE_WITHOUT_HEAD(start__fails);
ATF_TEST_CASE_BODY(start__fails)
{
    engine::docker_runtime runtime = setup_runtime();
    ATF_REQUIRE_THROW_RE(engine::container_error,
                         "^docker start failed: Error: boom$",
                         runtime.start("broken"));
}


ATF_TEST_CASE_WITHOUT_HEAD(remove__missing);
ATF_TEST_CASE_BODY(remove__missing)
{
    engine::docker_runtime runtime = setup_runtime();
    runtime.remove("gone");
    ATF_REQUIRE_EQ("rm --force gone\n",
                   utils::read_file(fs::path("calls.log")));
}


ATF_TEST_CASE_WITHOUT_HEAD(remove__fails);
ATF_TEST_CASE_BODY(remove__fails)
{
    engine::docker_runtime runtime = setup_runtime();
    ATF_REQUIRE_THROW_RE(engine::container_error,
                         "^docker rm failed: Error: device or resource busy$",
                         runtime.remove("stuck"));
}


ATF_TEST_CASE_WITHOUT_HEAD(wait__timeout);
ATF_TEST_CASE_BODY(wait__timeout)
{
    engine::docker_runtime runtime = setup_runtime();
    const datetime::timestamp start = datetime::timestamp::now();
    ATF_REQUIRE(!runtime.wait("slow", datetime::delta(1, 0)));
    ATF_REQUIRE(datetime::timestamp::now() - start < datetime::delta(8, 0));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, create_args__isolated);
    ATF_ADD_TEST_CASE(tcs, create_args__network);
    ATF_ADD_TEST_CASE(tcs, version);
    ATF_ADD_TEST_CASE(tcs, missing_client);
    ATF_ADD_TEST_CASE(tcs, lifecycle);
    ATF_ADD_TEST_CASE(tcs, create__image_not_found);
    ATF_ADD_TEST_CASE(tcs, start__fails);
    ATF_ADD_TEST_CASE(tcs, remove__missing);
    ATF_ADD_TEST_CASE(tcs, remove__fails);
    ATF_ADD_TEST_CASE(tcs, wait__timeout);
}
