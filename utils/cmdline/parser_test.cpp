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

#include "utils/cmdline/parser.ipp"

#include <string>
#include <utility>
#include <vector>

#include <atf-c++.hpp>

#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/options.hpp"

namespace cmdline = utils::cmdline;


namespace {


/// Builds the set of options used by most tests.
///
/// \param [out] bool_opt Storage for the boolean option.
/// \param [out] int_opt Storage for the integer option.
/// \param [out] prop_opt Storage for the property option.
///
/// \return The options vector pointing to the given options.
static cmdline::options_vector
make_options(const cmdline::bool_option& bool_opt,
             const cmdline::int_option& int_opt,
             const cmdline::property_option& prop_opt)
{
    cmdline::options_vector options;
    options.push_back(&bool_opt);
    options.push_back(&int_opt);
    options.push_back(&prop_opt);
    return options;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(parse__no_options);
ATF_TEST_CASE_BODY(parse__no_options)
{
    const char* const argv[] = {"corral", "check", "code.py", NULL};
    const cmdline::parsed_cmdline cmdline = cmdline::parse(
        3, argv, cmdline::options_vector());

    ATF_REQUIRE_EQ(2, cmdline.arguments().size());
    ATF_REQUIRE_EQ("check", cmdline.arguments()[0]);
    ATF_REQUIRE_EQ("code.py", cmdline.arguments()[1]);
}


ATF_TEST_CASE_WITHOUT_HEAD(parse__mixed);
ATF_TEST_CASE_BODY(parse__mixed)
{
    const cmdline::bool_option bool_opt("network", "Networking");
    const cmdline::int_option int_opt('t', "timeout", "Timeout", "seconds",
                                      "180");
    const cmdline::property_option prop_opt('v', "variable", "Override",
                                            "name=value");

    cmdline::args_vector args;
    args.push_back("run");
    args.push_back("--network");
    args.push_back("-t");
    args.push_back("10");
    args.push_back("-vbackend=host");
    args.push_back("--variable=timeout=5");
    args.push_back("code.py");
    args.push_back("--not-an-option");
    const cmdline::parsed_cmdline cmdline = cmdline::parse(
        args, make_options(bool_opt, int_opt, prop_opt));

    ATF_REQUIRE(cmdline.has_option("network"));
    ATF_REQUIRE_EQ(10, cmdline.get_option< cmdline::int_option >("timeout"));

    const std::vector< std::pair< std::string, std::string > > props =
        cmdline.get_multi_option< cmdline::property_option >("variable");
    ATF_REQUIRE_EQ(2, props.size());
    ATF_REQUIRE_EQ("backend", props[0].first);
    ATF_REQUIRE_EQ("host", props[0].second);
    ATF_REQUIRE_EQ("timeout", props[1].first);
    ATF_REQUIRE_EQ("5", props[1].second);

    ATF_REQUIRE_EQ(2, cmdline.arguments().size());
    ATF_REQUIRE_EQ("code.py", cmdline.arguments()[0]);
    ATF_REQUIRE_EQ("--not-an-option", cmdline.arguments()[1]);
}


ATF_TEST_CASE_WITHOUT_HEAD(parse__default_values);
ATF_TEST_CASE_BODY(parse__default_values)
{
    const cmdline::bool_option bool_opt("network", "Networking");
    const cmdline::int_option int_opt('t', "timeout", "Timeout", "seconds",
                                      "180");
    const cmdline::property_option prop_opt('v', "variable", "Override",
                                            "name=value");

    cmdline::args_vector args;
    args.push_back("run");
    const cmdline::parsed_cmdline cmdline = cmdline::parse(
        args, make_options(bool_opt, int_opt, prop_opt));

    ATF_REQUIRE(!cmdline.has_option("network"));
    ATF_REQUIRE_EQ(180, cmdline.get_option< cmdline::int_option >("timeout"));
    ATF_REQUIRE(cmdline.get_multi_option< cmdline::property_option >(
        "variable").empty());
    ATF_REQUIRE(cmdline.arguments().empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(parse__last_value_wins);
ATF_TEST_CASE_BODY(parse__last_value_wins)
{
    const cmdline::int_option int_opt("timeout", "Timeout", "seconds", "180");
    cmdline::options_vector options;
    options.push_back(&int_opt);

    cmdline::args_vector args;
    args.push_back("run");
    args.push_back("--timeout=1");
    args.push_back("--timeout=2");
    const cmdline::parsed_cmdline cmdline = cmdline::parse(args, options);
    ATF_REQUIRE_EQ(2, cmdline.get_option< cmdline::int_option >("timeout"));
}


ATF_TEST_CASE_WITHOUT_HEAD(parse__unknown_options);
ATF_TEST_CASE_BODY(parse__unknown_options)
{
    const cmdline::bool_option bool_opt("network", "Networking");
    cmdline::options_vector options;
    options.push_back(&bool_opt);

    {
        cmdline::args_vector args;
        args.push_back("run");
        args.push_back("--memory");
        try {
            cmdline::parse(args, options);
            fail("unknown_option_error not raised");
        } catch (const cmdline::unknown_option_error& e) {
            ATF_REQUIRE_EQ("--memory", e.option());
        }
    }
    {
        cmdline::args_vector args;
        args.push_back("run");
        args.push_back("-x");
        try {
            cmdline::parse(args, options);
            fail("unknown_option_error not raised");
        } catch (const cmdline::unknown_option_error& e) {
            ATF_REQUIRE_EQ("-x", e.option());
        }
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(parse__missing_argument);
ATF_TEST_CASE_BODY(parse__missing_argument)
{
    const cmdline::string_option string_opt('l', "language", "Language",
                                            "name");
    const cmdline::int_option int_opt("timeout", "Timeout", "seconds");
    cmdline::options_vector options;
    options.push_back(&string_opt);
    options.push_back(&int_opt);

    {
        cmdline::args_vector args;
        args.push_back("run");
        args.push_back("-l");
        try {
            cmdline::parse(args, options);
            fail("missing_option_argument_error not raised");
        } catch (const cmdline::missing_option_argument_error& e) {
            ATF_REQUIRE_EQ("-l", e.option());
        }
    }
    {
        cmdline::args_vector args;
        args.push_back("run");
        args.push_back("--timeout");
        try {
            cmdline::parse(args, options);
            fail("missing_option_argument_error not raised");
        } catch (const cmdline::missing_option_argument_error& e) {
            ATF_REQUIRE_EQ("--timeout", e.option());
        }
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(parse__invalid_argument);
ATF_TEST_CASE_BODY(parse__invalid_argument)
{
    const cmdline::int_option int_opt("timeout", "Timeout", "seconds");
    cmdline::options_vector options;
    options.push_back(&int_opt);

    cmdline::args_vector args;
    args.push_back("run");
    args.push_back("--timeout=forever");
    ATF_REQUIRE_THROW_RE(cmdline::option_argument_value_error,
                         "forever.*--timeout",
                         cmdline::parse(args, options));
}


ATF_TEST_CASE_WITHOUT_HEAD(parse__reentrant);
ATF_TEST_CASE_BODY(parse__reentrant)
{
    const cmdline::bool_option bool_opt('n', "network", "Networking");
    cmdline::options_vector options;
    options.push_back(&bool_opt);

    for (int i = 0; i < 3; i++) {
        cmdline::args_vector args;
        args.push_back("run");
        args.push_back("-n");
        args.push_back("arg");
        const cmdline::parsed_cmdline cmdline = cmdline::parse(args, options);
        ATF_REQUIRE(cmdline.has_option("network"));
        ATF_REQUIRE_EQ(1, cmdline.arguments().size());
    }
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, parse__no_options);
    ATF_ADD_TEST_CASE(tcs, parse__mixed);
    ATF_ADD_TEST_CASE(tcs, parse__default_values);
    ATF_ADD_TEST_CASE(tcs, parse__last_value_wins);
    ATF_ADD_TEST_CASE(tcs, parse__unknown_options);
    ATF_ADD_TEST_CASE(tcs, parse__missing_argument);
    ATF_ADD_TEST_CASE(tcs, parse__invalid_argument);
    ATF_ADD_TEST_CASE(tcs, parse__reentrant);
}
