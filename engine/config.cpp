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

#include <stdexcept>

#include <lutok/exceptions.hpp>
#include <lutok/operations.hpp>
#include <lutok/stack_cleaner.hpp>
#include <lutok/state.ipp>

#include "engine/exceptions.hpp"
#include "model/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/text/exceptions.hpp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace text = utils::text;


namespace {


/// Names of all the configuration properties; NULL-terminated.
static const char* const property_names[] = {
    "backend", "parallelism", "safety_check", "work_directory",
    "python_image", "javascript_image", "memory_limit", "cpu_limit",
    "timeout", "network", "host_timeout", "host_python", "docker",
    "docker_timeout", NULL };


/// Implementation of the Lua syntax() function.
///
/// \pre state(-2) The syntax format name.
/// \pre state(-1) The syntax format version.
///
/// \param state The Lua state to operate in.
///
/// \return The number of results pushed onto the stack; always 0.
static int
lua_syntax(lutok::state& state)
{
    if (!state.is_string(-2))
        throw std::runtime_error("First argument to syntax must be a string");
    const std::string syntax_format = state.to_string(-2);
    if (!state.is_number(-1))
        throw std::runtime_error("Second argument to syntax must be a number");
    const int syntax_version = state.to_integer(-1);

    state.get_global("_syntax_format");
    if (!state.is_nil())
        throw std::runtime_error("syntax() can only be invoked once");
    state.pop(1);

    if (syntax_format != "config")
        throw std::runtime_error(F("Unexpected file format '%s'; need "
                                   "'config'") % syntax_format);
    if (syntax_version != 1)
        throw std::runtime_error(F("Unexpected file version '%s'; only 1 is "
                                   "supported") % syntax_version);

    state.push_string(syntax_format);
    state.set_global("_syntax_format");
    return 0;
}


/// Parses a boolean property.
///
/// \param name The name of the property, for error reporting purposes.
/// \param value The textual value.
///
/// \return The boolean value.
///
/// \throw std::runtime_error If the value is not a boolean.
static bool
parse_boolean(const std::string& name, const std::string& value)
{
    try {
        return text::to_type< bool >(value);
    } catch (const text::value_error& e) {
        throw std::runtime_error(F("Invalid value '%s' for property '%s': "
                                   "must be true or false") % value % name);
    }
}


/// Parses a positive number of seconds.
///
/// \param name The name of the property, for error reporting purposes.
/// \param value The textual value.
///
/// \return The amount of time.
///
/// \throw std::runtime_error If the value is not a positive number.
static datetime::delta
parse_seconds(const std::string& name, const std::string& value)
{
    double seconds;
    try {
        seconds = text::to_type< double >(value);
    } catch (const text::value_error& e) {
        throw std::runtime_error(F("Invalid value '%s' for property '%s': "
                                   "must be a number of seconds") % value %
                                 name);
    }
    if (!(seconds > 0))
        throw std::runtime_error(F("Invalid value '%s' for property '%s': "
                                   "must be positive") % value % name);
    return datetime::delta::from_seconds(seconds);
}


/// Formats a boolean for user consumption.
///
/// \param value The value to format.
///
/// \return The textual representation accepted by parse_boolean().
static std::string
format_boolean(const bool value)
{
    return value ? "true" : "false";
}


}  // anonymous namespace


/// Parses the name of a backend selection strategy.
///
/// \param name The name to parse.
///
/// \return The parsed strategy.
///
/// \throw engine::error If the name is not valid.
engine::backend_mode
engine::backend_mode_from_name(const std::string& name)
{
    if (name == "auto")
        return backend_auto;
    else if (name == "container")
        return backend_container;
    else if (name == "host")
        return backend_host;
    else
        throw engine::error(F("Unknown backend '%s'; must be one of auto, "
                              "container or host") % name);
}


/// Returns the name of a backend selection strategy.
///
/// \param mode The strategy.
///
/// \return The name, as accepted by backend_mode_from_name().
const char*
engine::backend_mode_name(const backend_mode mode)
{
    switch (mode) {
    case backend_auto: return "auto";
    case backend_container: return "container";
    case backend_host: return "host";
    }
    UNREACHABLE;
}


/// Queries a global Lua variable and returns its textual form.
///
/// \param state The Lua state.
/// \param name The name of the variable.
///
/// \return The value of the variable as a string, or an empty string if the
/// variable is nil.
///
/// \throw std::runtime_error If the variable has an invalid type.
std::string
engine::detail::get_property_var(lutok::state& state, const std::string& name)
{
    lutok::stack_cleaner cleaner(state);

    state.get_global(name);
    if (state.is_nil())
        return "";
    else if (state.is_boolean())
        return format_boolean(state.to_boolean());
    else if (state.is_number() || state.is_string())
        return state.to_string();
    else
        throw std::runtime_error(F("Invalid type for variable '%s': must be "
                                   "a boolean, a number or a string") % name);
}


/// Constructs a config with the built-in settings.
engine::config::config(void) :
    backend(backend_auto),
    parallelism(4),
    safety_check(true),
    work_directory(fs::temp_directory()),
    python_image("python:3.11-slim"),
    javascript_image("node:18-slim"),
    host_timeout(5, 0),
    host_python("python3"),
    docker("docker"),
    docker_timeout(60, 0)
{
}


/// Parses a configuration file.
///
/// \param file The file to parse.
///
/// \return High-level representation of the configuration file with the
/// built-in settings for the properties it does not define.
///
/// \throw engine::load_error If there is any problem loading the file.  This
///     includes file access errors, syntax errors and invalid values.
engine::config
engine::config::load(const fs::path& file)
{
    LI(F("Loading configuration file '%s'") % file);
    config values;

    try {
        lutok::state state;
        lutok::stack_cleaner cleaner(state);

        state.open_base();
        state.open_string();
        state.open_table();
        state.push_cxx_function(lua_syntax);
        state.set_global("syntax");

        lutok::do_file(state, file.str(), 0, 0, 0);

        state.get_global("_syntax_format");
        const bool has_syntax = !state.is_nil();
        state.pop(1);
        if (!has_syntax)
            throw std::runtime_error("Syntax not defined; must call syntax()");

        for (const char* const* iter = property_names; *iter != NULL;
             ++iter) {
            const std::string value = detail::get_property_var(state, *iter);
            if (!value.empty())
                values.set_property(*iter, value);
        }
    } catch (const std::runtime_error& e) {
        throw load_error(file, e.what());
    }

    return values;
}


/// Updates properties in a configuration object based on textual definitions.
///
/// \param overrides The list of overrides to process.
///
/// \return A new configuration object with the overrides applied.
///
/// \throw engine::error If any override is invalid.
engine::config
engine::config::apply_overrides(
    const std::vector< override_pair >& overrides) const
{
    config new_config(*this);

    for (std::vector< override_pair >::const_iterator iter = overrides.begin();
         iter != overrides.end(); iter++) {
        LI(F("Applying override to configuration: key %s, value %s") %
           (*iter).first % (*iter).second);
        try {
            new_config.set_property((*iter).first, (*iter).second);
        } catch (const std::runtime_error& e) {
            throw engine::error(F("%s in override '%s=%s'") % e.what() %
                                (*iter).first % (*iter).second);
        }
    }

    return new_config;
}


/// Sets a property from its textual representation.
///
/// \param name The name of the property.
/// \param value The textual value, as returned by all_properties().
///
/// \throw std::runtime_error If the property is unknown or the value is
///     invalid for it.
void
engine::config::set_property(const std::string& name, const std::string& value)
{
    if (name == "backend") {
        backend = backend_mode_from_name(value);
    } else if (name == "parallelism") {
        int number;
        try {
            number = text::to_type< int >(value);
        } catch (const text::value_error& e) {
            number = 0;
        }
        if (number < 1)
            throw std::runtime_error(F("Invalid value '%s' for property "
                                       "'%s': must be a positive integer") %
                                     value % name);
        parallelism = number;
    } else if (name == "safety_check") {
        safety_check = parse_boolean(name, value);
    } else if (name == "work_directory") {
        work_directory = fs::path(value);
    } else if (name == "python_image") {
        python_image = value;
    } else if (name == "javascript_image") {
        javascript_image = value;
    } else if (name == "memory_limit") {
        limits = model::resource_limits(
            model::resource_limits::parse_memory(value), limits.cpu_share(),
            limits.timeout(), limits.network());
    } else if (name == "cpu_limit") {
        double share;
        try {
            share = text::to_type< double >(value);
        } catch (const text::value_error& e) {
            throw std::runtime_error(F("Invalid value '%s' for property "
                                       "'%s': must be a number") % value %
                                     name);
        }
        limits = model::resource_limits(limits.memory_bytes(), share,
                                        limits.timeout(), limits.network());
    } else if (name == "timeout") {
        limits = model::resource_limits(limits.memory_bytes(),
                                        limits.cpu_share(),
                                        parse_seconds(name, value),
                                        limits.network());
    } else if (name == "network") {
        limits = model::resource_limits(limits.memory_bytes(),
                                        limits.cpu_share(), limits.timeout(),
                                        parse_boolean(name, value));
    } else if (name == "host_timeout") {
        host_timeout = parse_seconds(name, value);
    } else if (name == "host_python") {
        host_python = value;
    } else if (name == "docker") {
        docker = value;
    } else if (name == "docker_timeout") {
        docker_timeout = parse_seconds(name, value);
    } else {
        throw std::runtime_error(F("Unrecognized configuration property "
                                   "'%s'") % name);
    }
}


/// Returns the container image for a language.
///
/// \param language The language of the code to run.
///
/// \return The name of the image.
const std::string&
engine::config::image(const model::language language) const
{
    switch (language) {
    case model::language_python: return python_image;
    case model::language_javascript: return javascript_image;
    }
    UNREACHABLE;
}


/// Returns all configuration properties as a key/value map.
///
/// The values are in the format accepted by set_property().
///
/// \return A key/value mapping describing all configuration properties.
engine::properties_map
engine::config::all_properties(void) const
{
    properties_map properties;

    properties["backend"] = backend_mode_name(backend);
    properties["parallelism"] = F("%s") % parallelism;
    properties["safety_check"] = format_boolean(safety_check);
    properties["work_directory"] = work_directory.str();
    properties["python_image"] = python_image;
    properties["javascript_image"] = javascript_image;
    properties["memory_limit"] = F("%s") % limits.memory_bytes();
    properties["cpu_limit"] = F("%s") % limits.cpu_share();
    properties["timeout"] = F("%s") % limits.timeout().to_seconds();
    properties["network"] = format_boolean(limits.network());
    properties["host_timeout"] = F("%s") % host_timeout.to_seconds();
    properties["host_python"] = host_python;
    properties["docker"] = docker;
    properties["docker_timeout"] = F("%s") % docker_timeout.to_seconds();

    return properties;
}


/// Checks if two configuration objects are equal.
///
/// \param other The object to compare to.
///
/// \return True if other and this are equal; false otherwise.
bool
engine::config::operator==(const config& other) const
{
    return (backend == other.backend &&
            parallelism == other.parallelism &&
            safety_check == other.safety_check &&
            work_directory == other.work_directory &&
            python_image == other.python_image &&
            javascript_image == other.javascript_image &&
            limits == other.limits &&
            host_timeout == other.host_timeout &&
            host_python == other.host_python &&
            docker == other.docker &&
            docker_timeout == other.docker_timeout);
}


/// Checks if two configuration objects are different.
///
/// \param other The object to compare to.
///
/// \return True if other and this are different; false otherwise.
bool
engine::config::operator!=(const config& other) const
{
    return !(*this == other);
}
