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

#include "engine/comparator.hpp"

#include <atf-c++.hpp>

namespace json = nlohmann;


namespace {


/// Checks that two values compare the same way in both directions.
///
/// \param expected The expected result of the comparison.
/// \param a The first value, in JSON text form.
/// \param b The second value, in JSON text form.
static void
check_symmetric(const bool expected, const char* a, const char* b)
{
    const json::json value_a = json::json::parse(a);
    const json::json value_b = json::json::parse(b);
    ATF_REQUIRE_EQ(expected, engine::equal(value_a, value_b));
    ATF_REQUIRE_EQ(expected, engine::equal(value_b, value_a));
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(reflexive);
ATF_TEST_CASE_BODY(reflexive)
{
    const char* values[] = {
        "null", "true", "false", "0", "-7", "3.25", "\"\"", "\"text\"",
        "[]", "[1, [2, 3.5], {\"a\": null}]", "{}",
        "{\"k\": [1, 2], \"j\": {\"x\": false}}", NULL };
    for (const char** iter = values; *iter != NULL; ++iter) {
        const json::json value = json::json::parse(*iter);
        ATF_REQUIRE(engine::equal(value, value));
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(null);
ATF_TEST_CASE_BODY(null)
{
    check_symmetric(true, "null", "null");
    check_symmetric(false, "null", "0");
    check_symmetric(false, "null", "false");
    check_symmetric(false, "null", "\"\"");
    check_symmetric(false, "null", "[]");
}


ATF_TEST_CASE_WITHOUT_HEAD(numbers__integers);
ATF_TEST_CASE_BODY(numbers__integers)
{
    check_symmetric(true, "3", "3");
    check_symmetric(false, "3", "4");
    check_symmetric(true, "-1", "-1");
    check_symmetric(true, "18446744073709551615", "18446744073709551615");
}


ATF_TEST_CASE_WITHOUT_HEAD(numbers__tolerance);
ATF_TEST_CASE_BODY(numbers__tolerance)
{
    check_symmetric(true, "1.0000001", "1.0000000");
    check_symmetric(false, "1.1", "1.0");
    check_symmetric(true, "3", "3.0");
    check_symmetric(true, "3", "3.0000001");
    check_symmetric(false, "3", "3.001");
    check_symmetric(true, "0.30000000000000004", "0.3");
}


ATF_TEST_CASE_WITHOUT_HEAD(types_differ);
ATF_TEST_CASE_BODY(types_differ)
{
    check_symmetric(false, "1", "true");
    check_symmetric(false, "0", "false");
    check_symmetric(false, "\"1\"", "1");
    check_symmetric(false, "[1]", "1");
    check_symmetric(false, "{}", "[]");
}


ATF_TEST_CASE_WITHOUT_HEAD(sequences);
ATF_TEST_CASE_BODY(sequences)
{
    check_symmetric(true, "[1, 2, 3]", "[1, 2, 3]");
    check_symmetric(false, "[1, 2, 3]", "[3, 2, 1]");
    check_symmetric(false, "[1, 2]", "[1, 2, 3]");
    check_symmetric(true, "[[1.0000001], [\"a\"]]", "[[1], [\"a\"]]");
    check_symmetric(false, "[[1], [\"a\"]]", "[[1], [\"b\"]]");
}


ATF_TEST_CASE_WITHOUT_HEAD(mappings);
ATF_TEST_CASE_BODY(mappings)
{
    check_symmetric(true, "{\"a\": 1, \"b\": 2}", "{\"b\": 2, \"a\": 1}");
    check_symmetric(false, "{\"a\": 1}", "{\"a\": 1, \"b\": 2}");
    check_symmetric(false, "{\"a\": 1}", "{\"b\": 1}");
    check_symmetric(true, "{\"a\": [0.1]}", "{\"a\": [0.1000000001]}");
    check_symmetric(false, "{\"a\": null}", "{\"a\": 0}");
}


ATF_TEST_CASE_WITHOUT_HEAD(strings_and_booleans);
ATF_TEST_CASE_BODY(strings_and_booleans)
{
    check_symmetric(true, "\"olleh\"", "\"olleh\"");
    check_symmetric(false, "\"olleh\"", "\"hello\"");
    check_symmetric(true, "true", "true");
    check_symmetric(false, "true", "false");
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, reflexive);
    ATF_ADD_TEST_CASE(tcs, null);
    ATF_ADD_TEST_CASE(tcs, numbers__integers);
    ATF_ADD_TEST_CASE(tcs, numbers__tolerance);
    ATF_ADD_TEST_CASE(tcs, types_differ);
    ATF_ADD_TEST_CASE(tcs, sequences);
    ATF_ADD_TEST_CASE(tcs, mappings);
    ATF_ADD_TEST_CASE(tcs, strings_and_booleans);
}
