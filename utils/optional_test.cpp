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

#include "utils/optional.ipp"

#include <sstream>
#include <string>

#include <atf-c++.hpp>

using utils::none;
using utils::optional;


namespace {


/// Simulates a lookup that may not yield a value.
///
/// \param key The key to look up.
///
/// \return The value for "image" or none otherwise.
static optional< std::string >
lookup(const std::string& key)
{
    if (key == "image")
        return utils::make_optional(std::string("python:3.11-slim"));
    else
        return none;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(ctors);
ATF_TEST_CASE_BODY(ctors)
{
    const optional< int > no_args;
    ATF_REQUIRE(!no_args);

    const optional< int > with_none(none);
    ATF_REQUIRE(!with_none);

    const optional< std::string > with_arg(std::string("node:18-slim"));
    ATF_REQUIRE(with_arg);
    ATF_REQUIRE_EQ("node:18-slim", with_arg.get());

    const optional< std::string > copy_arg(with_arg);
    ATF_REQUIRE(copy_arg);
    ATF_REQUIRE_EQ("node:18-slim", copy_arg.get());
}


ATF_TEST_CASE_WITHOUT_HEAD(assign__independent_copies);
ATF_TEST_CASE_BODY(assign__independent_copies)
{
    optional< int > first(3);
    optional< int > second;
    second = first;
    second = 5;
    ATF_REQUIRE_EQ(3, first.get());
    ATF_REQUIRE_EQ(5, second.get());

    second = none;
    ATF_REQUIRE(!second);
    first = second;
    ATF_REQUIRE(!first);
}


ATF_TEST_CASE_WITHOUT_HEAD(get_default);
ATF_TEST_CASE_BODY(get_default)
{
    ATF_REQUIRE_EQ(180, optional< int >().get_default(180));
    ATF_REQUIRE_EQ(5, optional< int >(5).get_default(180));
}


ATF_TEST_CASE_WITHOUT_HEAD(compare);
ATF_TEST_CASE_BODY(compare)
{
    ATF_REQUIRE(optional< int >() == optional< int >(none));
    ATF_REQUIRE(optional< int >(1) == optional< int >(1));
    ATF_REQUIRE(optional< int >(1) != optional< int >(2));
    ATF_REQUIRE(optional< int >(1) != optional< int >());
}


ATF_TEST_CASE_WITHOUT_HEAD(return_value);
ATF_TEST_CASE_BODY(return_value)
{
    ATF_REQUIRE_EQ("python:3.11-slim", lookup("image").get());
    ATF_REQUIRE(!lookup("missing"));
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    std::ostringstream str;
    str << optional< int >() << " " << optional< int >(42);
    ATF_REQUIRE_EQ("none 42", str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, ctors);
    ATF_ADD_TEST_CASE(tcs, assign__independent_copies);
    ATF_ADD_TEST_CASE(tcs, get_default);
    ATF_ADD_TEST_CASE(tcs, compare);
    ATF_ADD_TEST_CASE(tcs, return_value);
    ATF_ADD_TEST_CASE(tcs, output);
}
