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

#include "utils/cmdline/commands_map.ipp"

#include <atf-c++.hpp>

#include "utils/cmdline/base_command.hpp"
#include "utils/sanity.hpp"

namespace cmdline = utils::cmdline;


namespace {


/// Fake command to populate the map.
class mock_cmd : public cmdline::base_command_no_data {
public:
    /// Constructs a fake command.
    ///
    /// \param mock_name The name of the command.
    mock_cmd(const char* mock_name) :
        cmdline::base_command_no_data(mock_name, "", 0, 0,
                                      "Command for testing.")
    {
    }

    /// Runs the command.
    ///
    /// \return Nothing because this function is never called.
    int
    run(cmdline::ui* /* ui */, const cmdline::parsed_cmdline& /* cmdline */)
    {
        UNREACHABLE;
    }
};


/// Map of the fake commands.
typedef cmdline::commands_map< cmdline::base_command_no_data > mock_map;


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(empty);
ATF_TEST_CASE_BODY(empty)
{
    mock_map commands;
    ATF_REQUIRE(commands.empty());
    ATF_REQUIRE(commands.begin() == commands.end());
}


ATF_TEST_CASE_WITHOUT_HEAD(some);
ATF_TEST_CASE_BODY(some)
{
    cmdline::base_command_no_data* run = new mock_cmd("run");
    cmdline::base_command_no_data* batch = new mock_cmd("batch");

    mock_map commands;
    commands.insert(run);
    commands.insert(mock_map::command_ptr(batch));

    ATF_REQUIRE(!commands.empty());

    mock_map::const_iterator iter = commands.begin();
    ATF_REQUIRE((*iter).first == "batch");
    ATF_REQUIRE((*iter).second == batch);

    ++iter;
    ATF_REQUIRE((*iter).first == "run");
    ATF_REQUIRE((*iter).second == run);

    ATF_REQUIRE(++iter == commands.end());
}


ATF_TEST_CASE_WITHOUT_HEAD(find__match);
ATF_TEST_CASE_BODY(find__match)
{
    cmdline::base_command_no_data* run = new mock_cmd("run");
    cmdline::base_command_no_data* check = new mock_cmd("check");

    mock_map commands;
    commands.insert(run);
    commands.insert(check);

    ATF_REQUIRE(run == commands.find("run"));
    ATF_REQUIRE(check == commands.find("check"));

    const mock_map& const_commands = commands;
    ATF_REQUIRE(run == const_commands.find("run"));
}


ATF_TEST_CASE_WITHOUT_HEAD(find__nomatch);
ATF_TEST_CASE_BODY(find__nomatch)
{
    mock_map commands;
    commands.insert(new mock_cmd("run"));

    ATF_REQUIRE(NULL == commands.find("rum"));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, empty);
    ATF_ADD_TEST_CASE(tcs, some);
    ATF_ADD_TEST_CASE(tcs, find__match);
    ATF_ADD_TEST_CASE(tcs, find__nomatch);
}
