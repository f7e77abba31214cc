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

#include "engine/container_runtime.hpp"

#include "engine/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"

namespace fs = utils::fs;
namespace process = utils::process;


/// Constructor.
///
/// \param name_ Unique name of the container.
/// \param image_ Image the container runs.
/// \param workspace_ Host directory to mount as the working directory.
/// \param command_ Entry command of the container.
/// \param limits_ Constraints to apply to the container.
engine::container_spec::container_spec(const std::string& name_,
                                       const std::string& image_,
                                       const fs::path& workspace_,
                                       const process::args_vector& command_,
                                       const model::resource_limits& limits_) :
    name(name_),
    image(image_),
    workspace(workspace_),
    command(command_),
    limits(limits_)
{
}


/// Destructor.
engine::container_runtime::~container_runtime(void)
{
}


/// Checks if a container runtime is usable.
///
/// \param runtime The runtime to query.
///
/// \return An empty string if the runtime answered a version query, or the
/// reason why it is unusable otherwise.
std::string
engine::check_requirements(container_runtime& runtime)
{
    try {
        const std::string version = runtime.version();
        LI(F("Container runtime version %s") % version);
        return "";
    } catch (const engine::container_error& e) {
        LW(F("Container runtime unavailable: %s") % e.what());
        return e.what();
    }
}
