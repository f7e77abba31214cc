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

#include "utils/process/child.hpp"

extern "C" {
#include <unistd.h>
}

#include <memory>
#include <string>

#include <atf-c++.hpp>

#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"
#include "utils/process/status.hpp"

namespace fs = utils::fs;
namespace process = utils::process;


namespace {


/// Builds the arguments to run a shell snippet.
///
/// \param script The shell code to run.
///
/// \return The arguments to pass to /bin/sh.
static process::args_vector
shell_args(const std::string& script)
{
    process::args_vector args;
    args.push_back("-c");
    args.push_back(script);
    return args;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(fork_capture__multiplexed_output);
ATF_TEST_CASE_BODY(fork_capture__multiplexed_output)
{
    std::unique_ptr< process::child > child = process::child::fork_capture(
        fs::path("/bin/sh"), shell_args("echo out; echo err 1>&2; exit 3"));
    ATF_REQUIRE_EQ("out\nerr\n", child->read_output());
    const process::status status = child->wait();
    ATF_REQUIRE(status.exited());
    ATF_REQUIRE_EQ(3, status.exitstatus());
}


ATF_TEST_CASE_WITHOUT_HEAD(fork_capture__arguments_verbatim);
ATF_TEST_CASE_BODY(fork_capture__arguments_verbatim)
{
    process::args_vector args = shell_args("printf '%s|' \"$@\"");
    args.push_back("sh");
    args.push_back("first arg");
    args.push_back("$HOME");
    std::unique_ptr< process::child > child = process::child::fork_capture(
        fs::path("/bin/sh"), args);
    ATF_REQUIRE_EQ("first arg|$HOME|", child->read_output());
    ATF_REQUIRE(child->wait().exited());
}


ATF_TEST_CASE_WITHOUT_HEAD(fork_capture__work_directory);
ATF_TEST_CASE_BODY(fork_capture__work_directory)
{
    fs::mkdir(fs::path("workspace"), 0755);
    atf::utils::create_file("workspace/code.py", "");
    std::unique_ptr< process::child > child = process::child::fork_capture(
        fs::path("/bin/sh"), shell_args("ls"),
        utils::make_optional(fs::path("workspace")));
    ATF_REQUIRE_EQ("code.py\n", child->read_output());
    ATF_REQUIRE_EQ(0, child->wait().exitstatus());
}


ATF_TEST_CASE_WITHOUT_HEAD(fork_capture__own_process_group);
ATF_TEST_CASE_BODY(fork_capture__own_process_group)
{
    std::unique_ptr< process::child > child = process::child::fork_capture(
        fs::path("/bin/sh"), shell_args("cut -d' ' -f5 /proc/$$/stat"));
    const std::string output = child->read_output();
    child->wait();
    ATF_REQUIRE_EQ((F("%s\n") % child->pid()).str(), output);
}


ATF_TEST_CASE_WITHOUT_HEAD(fork_capture__exec_fails);
ATF_TEST_CASE_BODY(fork_capture__exec_fails)
{
    std::unique_ptr< process::child > child = process::child::fork_capture(
        fs::path("/non-existent/interpreter"), process::args_vector());
    const std::string output = child->read_output();
    ATF_REQUIRE(atf::utils::grep_string(
        "Failed to execute /non-existent/interpreter", output));
    const process::status status = child->wait();
    ATF_REQUIRE(status.exited());
    ATF_REQUIRE_EQ(127, status.exitstatus());
}


ATF_TEST_CASE_WITHOUT_HEAD(fork_capture__missing_work_directory);
ATF_TEST_CASE_BODY(fork_capture__missing_work_directory)
{
    std::unique_ptr< process::child > child = process::child::fork_capture(
        fs::path("/bin/sh"), shell_args("true"),
        utils::make_optional(fs::path("missing")));
    ATF_REQUIRE(atf::utils::grep_string("Failed to enter the work directory",
                                        child->read_output()));
    ATF_REQUIRE_EQ(127, child->wait().exitstatus());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, fork_capture__multiplexed_output);
    ATF_ADD_TEST_CASE(tcs, fork_capture__arguments_verbatim);
    ATF_ADD_TEST_CASE(tcs, fork_capture__work_directory);
    ATF_ADD_TEST_CASE(tcs, fork_capture__own_process_group);
    ATF_ADD_TEST_CASE(tcs, fork_capture__exec_fails);
    ATF_ADD_TEST_CASE(tcs, fork_capture__missing_work_directory);
}
