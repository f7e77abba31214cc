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

/// \file engine/config.hpp
/// Engine configuration parsing and representation.
///
/// Configuration files are Lua scripts.  They must call syntax("config", 1)
/// before anything else and then assign the configuration properties as
/// global variables.  Unknown variables are ignored.

#if !defined(ENGINE_CONFIG_HPP)
#define ENGINE_CONFIG_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <lutok/state.hpp>

#include "model/language.hpp"
#include "model/resource_limits.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"

namespace engine {


/// An override for a configuration property in the form of a key/value pair.
typedef std::pair< std::string, std::string > override_pair;


/// Collection of key/value string pairs describing configuration properties.
typedef std::map< std::string, std::string > properties_map;


/// Strategies to select the execution backend.
enum backend_mode {
    backend_auto,
    backend_container,
    backend_host,
};


backend_mode backend_mode_from_name(const std::string&);
const char* backend_mode_name(const backend_mode);


namespace detail {


std::string get_property_var(lutok::state&, const std::string&);


}  // namespace detail


/// Representation of corral configuration files.
struct config {
    /// How to select the execution backend.
    backend_mode backend;

    /// Number of requests that can run concurrently.
    int parallelism;

    /// Whether Python code is pre-screened before running it.
    bool safety_check;

    /// Directory in which to create the transient workspaces.
    utils::fs::path work_directory;

    /// Container image for Python code.
    std::string python_image;

    /// Container image for JavaScript code.
    std::string javascript_image;

    /// Default resource envelope of requests.
    model::resource_limits limits;

    /// Deadline of each test case in the host executor.
    utils::datetime::delta host_timeout;

    /// Name or path of the interpreter used by the host executor.
    std::string host_python;

    /// Name or path of the docker client.
    std::string docker;

    /// Deadline for docker commands other than waiting for a container.
    utils::datetime::delta docker_timeout;

    config(void);
    static config load(const utils::fs::path&);

    config apply_overrides(const std::vector< override_pair >&) const;
    void set_property(const std::string&, const std::string&);

    const std::string& image(const model::language) const;

    properties_map all_properties(void) const;

    bool operator==(const config&) const;
    bool operator!=(const config&) const;
};


}  // namespace engine

#endif  // !defined(ENGINE_CONFIG_HPP)
