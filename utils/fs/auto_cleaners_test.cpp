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

#include "utils/fs/auto_cleaners.hpp"

#include <atf-c++.hpp>

#include "utils/fs/exceptions.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"

namespace fs = utils::fs;


ATF_TEST_CASE_WITHOUT_HEAD(auto_directory__adopt);
ATF_TEST_CASE_BODY(auto_directory__adopt)
{
    fs::mkdir(fs::path("root"), 0755);
    atf::utils::create_file("root/runner.py", "");
    {
        fs::auto_directory dir(fs::path("root"));
        ATF_REQUIRE_EQ(fs::path("root"), dir.directory());
        ATF_REQUIRE(fs::exists(fs::path("root/runner.py")));
    }
    ATF_REQUIRE(!fs::exists(fs::path("root")));
}


ATF_TEST_CASE_WITHOUT_HEAD(auto_directory__create);
ATF_TEST_CASE_BODY(auto_directory__create)
{
    fs::path created("unset");
    {
        fs::auto_directory dir(fs::path("work/nested"), "corral");
        created = dir.directory();
        ATF_REQUIRE_EQ(fs::path("work/nested"), created.branch_path());
        ATF_REQUIRE_MATCH("^corral\\.", created.leaf_name());
        ATF_REQUIRE(fs::exists(created));

        atf::utils::create_file((dir / "code.py").str(), "pass\n");
        ATF_REQUIRE(fs::exists(created / "code.py"));
    }
    ATF_REQUIRE(!fs::exists(created));
    ATF_REQUIRE(fs::exists(fs::path("work/nested")));
}


ATF_TEST_CASE_WITHOUT_HEAD(auto_directory__create_unique);
ATF_TEST_CASE_BODY(auto_directory__create_unique)
{
    fs::auto_directory first(fs::path("work"), "corral");
    fs::auto_directory second(fs::path("work"), "corral");
    ATF_REQUIRE(first.directory() != second.directory());
}


ATF_TEST_CASE_WITHOUT_HEAD(auto_directory__explicit_cleanup);
ATF_TEST_CASE_BODY(auto_directory__explicit_cleanup)
{
    fs::mkdir(fs::path("root"), 0755);
    fs::auto_directory dir(fs::path("root"));
    dir.cleanup();
    ATF_REQUIRE(!fs::exists(fs::path("root")));
    dir.cleanup();
}


ATF_TEST_CASE_WITHOUT_HEAD(auto_directory__cleanup_error);
ATF_TEST_CASE_BODY(auto_directory__cleanup_error)
{
    fs::auto_directory dir(fs::path("never-created"));
    ATF_REQUIRE_THROW(fs::error, dir.cleanup());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, auto_directory__adopt);
    ATF_ADD_TEST_CASE(tcs, auto_directory__create);
    ATF_ADD_TEST_CASE(tcs, auto_directory__create_unique);
    ATF_ADD_TEST_CASE(tcs, auto_directory__explicit_cleanup);
    ATF_ADD_TEST_CASE(tcs, auto_directory__cleanup_error);
}
