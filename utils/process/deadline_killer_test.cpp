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

#include "utils/process/deadline_killer.hpp"

extern "C" {
#include <signal.h>
}

#include <memory>

#include <atf-c++.hpp>

#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/process/child.hpp"
#include "utils/process/operations.hpp"
#include "utils/process/status.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace process = utils::process;


namespace {


/// Spawns a shell that sleeps for the given amount of seconds.
///
/// \param seconds The time to sleep for.
///
/// \return The child process.
static std::unique_ptr< process::child >
spawn_sleeper(const int seconds)
{
    process::args_vector args;
    args.push_back("-c");
    args.push_back(F("sleep %s") % seconds);
    return process::child::fork_capture(fs::path("/bin/sh"), args);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(activation);
ATF_TEST_CASE_BODY(activation)
{
    std::unique_ptr< process::child > child = spawn_sleeper(60);

    const datetime::timestamp start = datetime::timestamp::now();
    process::deadline_killer killer(datetime::delta(1, 0), child->pid());
    (void)child->read_output();
    const process::status status = child->wait();
    const datetime::timestamp end = datetime::timestamp::now();

    ATF_REQUIRE(killer.unschedule());
    ATF_REQUIRE(status.signaled());
    ATF_REQUIRE_EQ(SIGKILL, status.termsig());
    ATF_REQUIRE((end - start) < datetime::delta(10, 0));
}


ATF_TEST_CASE_WITHOUT_HEAD(no_activation);
ATF_TEST_CASE_BODY(no_activation)
{
    std::unique_ptr< process::child > child = spawn_sleeper(1);

    process::deadline_killer killer(datetime::delta(60, 0), child->pid());
    (void)child->read_output();
    const process::status status = child->wait();

    ATF_REQUIRE(!killer.unschedule());
    ATF_REQUIRE(status.exited());
    ATF_REQUIRE_EQ(0, status.exitstatus());
}


ATF_TEST_CASE_WITHOUT_HEAD(earlier_deadline_registered_later);
ATF_TEST_CASE_BODY(earlier_deadline_registered_later)
{
    std::unique_ptr< process::child > slow = spawn_sleeper(60);
    std::unique_ptr< process::child > fast = spawn_sleeper(60);

    process::deadline_killer slow_killer(datetime::delta(120, 0), slow->pid());
    process::deadline_killer fast_killer(datetime::delta(1, 0), fast->pid());
    (void)fast->read_output();
    const process::status fast_status = fast->wait();
    ATF_REQUIRE(fast_killer.unschedule());
    ATF_REQUIRE(fast_status.signaled());

    ATF_REQUIRE(!slow_killer.unschedule());
    process::terminate_group(slow->pid());
    (void)slow->read_output();
    ATF_REQUIRE(slow->wait().signaled());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, activation);
    ATF_ADD_TEST_CASE(tcs, no_activation);
    ATF_ADD_TEST_CASE(tcs, earlier_deadline_registered_later);
}
