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

#include "utils/stream.hpp"

#include <fstream>
#include <sstream>

#include <atf-c++.hpp>

#include "utils/fs/path.hpp"

namespace fs = utils::fs;


ATF_TEST_CASE_WITHOUT_HEAD(read_stream__empty);
ATF_TEST_CASE_BODY(read_stream__empty)
{
    std::istringstream input("");
    ATF_REQUIRE_EQ("", utils::read_stream(input));
}


ATF_TEST_CASE_WITHOUT_HEAD(read_stream__binary);
ATF_TEST_CASE_BODY(read_stream__binary)
{
    const std::string data("first\0second\nthird", 18);
    std::istringstream input(data);
    ATF_REQUIRE(data == utils::read_stream(input));
}


ATF_TEST_CASE_WITHOUT_HEAD(read_stream__large);
ATF_TEST_CASE_BODY(read_stream__large)
{
    std::string data;
    for (int i = 0; i < 5000; i++)
        data += "0123456789";
    std::istringstream input(data);
    ATF_REQUIRE(data == utils::read_stream(input));
}


ATF_TEST_CASE_WITHOUT_HEAD(write_file__read_file);
ATF_TEST_CASE_BODY(write_file__read_file)
{
    utils::write_file(fs::path("test.txt"), "some\ncontents");
    ATF_REQUIRE_EQ("some\ncontents", utils::read_file(fs::path("test.txt")));

    utils::write_file(fs::path("test.txt"), "new");
    ATF_REQUIRE_EQ("new", utils::read_file(fs::path("test.txt")));
}


ATF_TEST_CASE_WITHOUT_HEAD(read_file__missing);
ATF_TEST_CASE_BODY(read_file__missing)
{
    ATF_REQUIRE_THROW_RE(std::runtime_error, "Failed to open 'missing.txt'",
                         utils::read_file(fs::path("missing.txt")));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, read_stream__empty);
    ATF_ADD_TEST_CASE(tcs, read_stream__binary);
    ATF_ADD_TEST_CASE(tcs, read_stream__large);
    ATF_ADD_TEST_CASE(tcs, write_file__read_file);
    ATF_ADD_TEST_CASE(tcs, read_file__missing);
}
