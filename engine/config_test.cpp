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

#include "engine/config.hpp"

#include <fstream>
#include <vector>

#include <atf-c++.hpp>

#include "engine/exceptions.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;


namespace {


/// Creates a configuration file.
///
/// \param name The name of the file to create.
/// \param contents The Lua code to put in the file.
static void
create_file(const char* name, const std::string& contents)
{
    std::ofstream output(name);
    ATF_REQUIRE(output);
    output << contents;
}


/// Checks that the default values of a config object match our expectations.
///
/// \param config The configuration to validate.
static void
validate_defaults(const engine::config& config)
{
    ATF_REQUIRE_EQ(engine::backend_auto, config.backend);
    ATF_REQUIRE_EQ(4, config.parallelism);
    ATF_REQUIRE(config.safety_check);
    ATF_REQUIRE_EQ("python:3.11-slim", config.python_image);
    ATF_REQUIRE_EQ("node:18-slim", config.javascript_image);
    ATF_REQUIRE(model::resource_limits() == config.limits);
    ATF_REQUIRE(datetime::delta(5, 0) == config.host_timeout);
    ATF_REQUIRE_EQ("python3", config.host_python);
    ATF_REQUIRE_EQ("docker", config.docker);
    ATF_REQUIRE(datetime::delta(60, 0) == config.docker_timeout);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(backend_mode);
ATF_TEST_CASE_BODY(backend_mode)
{
    ATF_REQUIRE_EQ(engine::backend_auto,
                   engine::backend_mode_from_name("auto"));
    ATF_REQUIRE_EQ(engine::backend_container,
                   engine::backend_mode_from_name("container"));
    ATF_REQUIRE_EQ(engine::backend_host,
                   engine::backend_mode_from_name("host"));
    ATF_REQUIRE_EQ(std::string("container"),
                   engine::backend_mode_name(engine::backend_container));
    ATF_REQUIRE_THROW_RE(engine::error, "Unknown backend 'docker'",
                         engine::backend_mode_from_name("docker"));
}


ATF_TEST_CASE_WITHOUT_HEAD(defaults);
ATF_TEST_CASE_BODY(defaults)
{
    validate_defaults(engine::config());
}


ATF_TEST_CASE_WITHOUT_HEAD(load__defaults);
ATF_TEST_CASE_BODY(load__defaults)
{
    create_file("config", "syntax('config', 1)\n");
    const engine::config config = engine::config::load(fs::path("config"));
    validate_defaults(config);
}


ATF_TEST_CASE_WITHOUT_HEAD(load__overrides);
ATF_TEST_CASE_BODY(load__overrides)
{
    create_file("config",
                "syntax('config', 1)\n"
                "backend = 'host'\n"
                "parallelism = 2 * 4\n"
                "safety_check = false\n"
                "work_directory = '/var/tmp'\n"
                "python_image = 'python:3.12-alpine'\n"
                "memory_limit = '256m'\n"
                "cpu_limit = 1.5\n"
                "timeout = 20\n"
                "network = true\n"
                "host_timeout = 2.5\n"
                "docker = '/usr/local/bin/docker'\n"
                "unrelated = {1, 2, 3}\n");
    const engine::config config = engine::config::load(fs::path("config"));

    ATF_REQUIRE_EQ(engine::backend_host, config.backend);
    ATF_REQUIRE_EQ(8, config.parallelism);
    ATF_REQUIRE(!config.safety_check);
    ATF_REQUIRE_EQ(fs::path("/var/tmp"), config.work_directory);
    ATF_REQUIRE_EQ("python:3.12-alpine", config.python_image);
    ATF_REQUIRE_EQ("node:18-slim", config.javascript_image);
    ATF_REQUIRE_EQ(256 * 1024 * 1024, config.limits.memory_bytes());
    ATF_REQUIRE_EQ(1.5, config.limits.cpu_share());
    ATF_REQUIRE(datetime::delta(20, 0) == config.limits.timeout());
    ATF_REQUIRE(config.limits.network());
    ATF_REQUIRE(datetime::delta(2, 500000) == config.host_timeout);
    ATF_REQUIRE_EQ("/usr/local/bin/docker", config.docker);
}


ATF_TEST_CASE_WITHOUT_HEAD(load__image_per_language);
ATF_TEST_CASE_BODY(load__image_per_language)
{
    create_file("config",
                "syntax('config', 1)\n"
                "javascript_image = 'node:20'\n");
    const engine::config config = engine::config::load(fs::path("config"));
    ATF_REQUIRE_EQ("python:3.11-slim",
                   config.image(model::language_python));
    ATF_REQUIRE_EQ("node:20", config.image(model::language_javascript));
}


ATF_TEST_CASE_WITHOUT_HEAD(load__missing_file);
ATF_TEST_CASE_BODY(load__missing_file)
{
    try {
        engine::config::load(fs::path("missing"));
        ATF_FAIL("load_error not raised");
    } catch (const engine::load_error& e) {
        ATF_REQUIRE_EQ(fs::path("missing"), e.file);
    }
}


ATF_TEST_CASE_WITHOUT_HEAD(load__no_syntax);
ATF_TEST_CASE_BODY(load__no_syntax)
{
    create_file("config", "backend = 'host'\n");
    ATF_REQUIRE_THROW_RE(engine::load_error, "must call syntax",
                         engine::config::load(fs::path("config")));
}


ATF_TEST_CASE_WITHOUT_HEAD(load__bad_syntax);
ATF_TEST_CASE_BODY(load__bad_syntax)
{
    create_file("config", "syntax('requests', 1)\n");
    ATF_REQUIRE_THROW_RE(engine::load_error, "Unexpected file format",
                         engine::config::load(fs::path("config")));

    create_file("config", "syntax('config', 2)\n");
    ATF_REQUIRE_THROW_RE(engine::load_error, "Unexpected file version '2'",
                         engine::config::load(fs::path("config")));

    create_file("config", "syntax('config', 1)\nsyntax('config', 1)\n");
    ATF_REQUIRE_THROW_RE(engine::load_error, "only be invoked once",
                         engine::config::load(fs::path("config")));
}


ATF_TEST_CASE_WITHOUT_HEAD(load__lua_error);
ATF_TEST_CASE_BODY(load__lua_error)
{
    create_file("config", "syntax('config', 1)\nthis is not lua\n");
    ATF_REQUIRE_THROW(engine::load_error,
                      engine::config::load(fs::path("config")));
}


ATF_TEST_CASE_WITHOUT_HEAD(load__invalid_values);
ATF_TEST_CASE_BODY(load__invalid_values)
{
    create_file("config", "syntax('config', 1)\nbackend = 'fast'\n");
    ATF_REQUIRE_THROW_RE(engine::load_error, "Unknown backend 'fast'",
                         engine::config::load(fs::path("config")));

    create_file("config", "syntax('config', 1)\nparallelism = 0\n");
    ATF_REQUIRE_THROW_RE(engine::load_error, "positive integer",
                         engine::config::load(fs::path("config")));

    create_file("config", "syntax('config', 1)\nmemory_limit = '12q'\n");
    ATF_REQUIRE_THROW_RE(engine::load_error, "Unknown memory unit",
                         engine::config::load(fs::path("config")));

    create_file("config", "syntax('config', 1)\ntimeout = {}\n");
    ATF_REQUIRE_THROW_RE(engine::load_error, "Invalid type for variable "
                         "'timeout'",
                         engine::config::load(fs::path("config")));
}


ATF_TEST_CASE_WITHOUT_HEAD(apply_overrides__none);
ATF_TEST_CASE_BODY(apply_overrides__none)
{
    const engine::config config;
    ATF_REQUIRE(config == config.apply_overrides(
        std::vector< engine::override_pair >()));
}


ATF_TEST_CASE_WITHOUT_HEAD(apply_overrides__some);
ATF_TEST_CASE_BODY(apply_overrides__some)
{
    std::vector< engine::override_pair > overrides;
    overrides.push_back(engine::override_pair("backend", "container"));
    overrides.push_back(engine::override_pair("timeout", "2"));
    overrides.push_back(engine::override_pair("safety_check", "false"));

    const engine::config config;
    const engine::config new_config = config.apply_overrides(overrides);
    ATF_REQUIRE(config != new_config);
    ATF_REQUIRE_EQ(engine::backend_container, new_config.backend);
    ATF_REQUIRE(datetime::delta(2, 0) == new_config.limits.timeout());
    ATF_REQUIRE_EQ(config.limits.memory_bytes(),
                   new_config.limits.memory_bytes());
    ATF_REQUIRE(!new_config.safety_check);
    validate_defaults(config);
}


ATF_TEST_CASE_WITHOUT_HEAD(apply_overrides__invalid);
ATF_TEST_CASE_BODY(apply_overrides__invalid)
{
    std::vector< engine::override_pair > overrides;
    overrides.push_back(engine::override_pair("architecture", "x86"));
    ATF_REQUIRE_THROW_RE(engine::error, "Unrecognized configuration property "
                         "'architecture' in override 'architecture=x86'",
                         engine::config().apply_overrides(overrides));

    overrides.clear();
    overrides.push_back(engine::override_pair("host_timeout", "-1"));
    ATF_REQUIRE_THROW_RE(engine::error, "must be positive in override",
                         engine::config().apply_overrides(overrides));
}


ATF_TEST_CASE_WITHOUT_HEAD(all_properties);
ATF_TEST_CASE_BODY(all_properties)
{
    const engine::properties_map properties =
        engine::config().all_properties();
    ATF_REQUIRE_EQ(14, properties.size());
    ATF_REQUIRE_EQ("auto", properties.find("backend")->second);
    ATF_REQUIRE_EQ("4", properties.find("parallelism")->second);
    ATF_REQUIRE_EQ("134217728", properties.find("memory_limit")->second);
    ATF_REQUIRE_EQ("0.5", properties.find("cpu_limit")->second);
    ATF_REQUIRE_EQ("180", properties.find("timeout")->second);
    ATF_REQUIRE_EQ("false", properties.find("network")->second);
}


ATF_TEST_CASE_WITHOUT_HEAD(all_properties__reapplied);
ATF_TEST_CASE_BODY(all_properties__reapplied)
{
    std::vector< engine::override_pair > overrides;
    overrides.push_back(engine::override_pair("cpu_limit", "0.25"));
    overrides.push_back(engine::override_pair("host_timeout", "1.5"));
    overrides.push_back(engine::override_pair("memory_limit", "1g"));
    const engine::config config = engine::config().apply_overrides(overrides);

    const engine::properties_map properties = config.all_properties();
    const std::vector< engine::override_pair > reapplied(properties.begin(),
                                                         properties.end());
    ATF_REQUIRE(config == engine::config().apply_overrides(reapplied));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, backend_mode);
    ATF_ADD_TEST_CASE(tcs, defaults);
    ATF_ADD_TEST_CASE(tcs, load__defaults);
    ATF_ADD_TEST_CASE(tcs, load__overrides);
    ATF_ADD_TEST_CASE(tcs, load__image_per_language);
    ATF_ADD_TEST_CASE(tcs, load__missing_file);
    ATF_ADD_TEST_CASE(tcs, load__no_syntax);
    ATF_ADD_TEST_CASE(tcs, load__bad_syntax);
    ATF_ADD_TEST_CASE(tcs, load__lua_error);
    ATF_ADD_TEST_CASE(tcs, load__invalid_values);
    ATF_ADD_TEST_CASE(tcs, apply_overrides__none);
    ATF_ADD_TEST_CASE(tcs, apply_overrides__some);
    ATF_ADD_TEST_CASE(tcs, apply_overrides__invalid);
    ATF_ADD_TEST_CASE(tcs, all_properties);
    ATF_ADD_TEST_CASE(tcs, all_properties__reapplied);
}
