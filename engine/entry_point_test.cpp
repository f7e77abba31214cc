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

#include "engine/entry_point.hpp"

#include <atf-c++.hpp>

#include "engine/exceptions.hpp"
#include "model/test_case.hpp"
#include "utils/optional.ipp"


ATF_TEST_CASE_WITHOUT_HEAD(find_entry_point__python__first_function);
ATF_TEST_CASE_BODY(find_entry_point__python__first_function)
{
    ATF_REQUIRE_EQ("add", engine::find_entry_point(
        model::language_python,
        "import math\n"
        "\n"
        "def add(a, b):\n"
        "    return a + b\n"
        "\n"
        "def sub(a, b):\n"
        "    return a - b\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(find_entry_point__python__skips_nested);
ATF_TEST_CASE_BODY(find_entry_point__python__skips_nested)
{
    ATF_REQUIRE_EQ("solve", engine::find_entry_point(
        model::language_python,
        "class Helper:\n"
        "    def method(self):\n"
        "        pass\n"
        "\n"
        "async def fetch():\n"
        "    pass\n"
        "\n"
        "@cache\n"
        "def solve(n):\n"
        "    def inner():\n"
        "        pass\n"
        "    return n\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(find_entry_point__python__none);
ATF_TEST_CASE_BODY(find_entry_point__python__none)
{
    ATF_REQUIRE_THROW_RE(engine::error, "No function definition found in code",
                         engine::find_entry_point(model::language_python,
                                                  "x = 1\nprint(x)\n"));
    ATF_REQUIRE_THROW_RE(engine::error, "No function definition found in code",
                         engine::find_entry_point(model::language_python,
                                                  "class A:\n"
                                                  "    def f(self): pass\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(find_entry_point__python__syntax_error);
ATF_TEST_CASE_BODY(find_entry_point__python__syntax_error)
{
    ATF_REQUIRE_THROW_RE(engine::syntax_error, "expected ':' \\(line 1\\)",
                         engine::find_entry_point(model::language_python,
                                                  "def f()\n    pass\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(find_entry_point__javascript);
ATF_TEST_CASE_BODY(find_entry_point__javascript)
{
    ATF_REQUIRE_EQ("twoSum", engine::find_entry_point(
        model::language_javascript,
        "async function load() {}\n"
        "const twoSum = (nums, target) => {\n"
        "    return [];\n"
        "};\n"
        "function helper() {}\n"));
    ATF_REQUIRE_THROW_RE(engine::error, "No function definition found in code",
                         engine::find_entry_point(model::language_javascript,
                                                  "console.log(1);\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(entry_point_for__declared);
ATF_TEST_CASE_BODY(entry_point_for__declared)
{
    const model::execution_request request(
        model::language_python, "this is not python(\n",
        model::test_cases_vector(), utils::make_optional(std::string("solve")));
    ATF_REQUIRE_EQ("solve", engine::entry_point_for(request));
}


ATF_TEST_CASE_WITHOUT_HEAD(entry_point_for__discovered);
ATF_TEST_CASE_BODY(entry_point_for__discovered)
{
    const model::execution_request request(
        model::language_javascript,
        "/*\n"
        "function helper(x) { return x; }\n"
        "*/\n"
        "const banner = `function fake(y) {}`;\n"
        "function solve(s) { return s.length; }\n",
        model::test_cases_vector());
    ATF_REQUIRE_EQ("solve", engine::entry_point_for(request));

    ATF_REQUIRE_THROW_RE(engine::error, "No function definition found in code",
                         engine::entry_point_for(model::execution_request(
                             model::language_python, "x = 1\n",
                             model::test_cases_vector())));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, find_entry_point__python__first_function);
    ATF_ADD_TEST_CASE(tcs, find_entry_point__python__skips_nested);
    ATF_ADD_TEST_CASE(tcs, find_entry_point__python__none);
    ATF_ADD_TEST_CASE(tcs, find_entry_point__python__syntax_error);
    ATF_ADD_TEST_CASE(tcs, find_entry_point__javascript);
    ATF_ADD_TEST_CASE(tcs, entry_point_for__declared);
    ATF_ADD_TEST_CASE(tcs, entry_point_for__discovered);
}
