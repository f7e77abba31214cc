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

#include "engine/backend.hpp"

#include "engine/exceptions.hpp"
#include "engine/host_executor.hpp"
#include "engine/sandbox.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"


/// Destructor.
engine::backend::~backend(void)
{
}


/// Selects and constructs the execution backend.
///
/// \param settings Configuration of the engine.
/// \param runtime Container runtime to use for the container backend.
///
/// \return The backend to run requests with.
///
/// \throw engine::error If the container backend was explicitly requested but
///     the runtime is not usable.
std::shared_ptr< engine::backend >
engine::setup_backend(const config& settings,
                      const std::shared_ptr< container_runtime >& runtime)
{
    switch (settings.backend) {
    case backend_container: {
        const std::string problem = check_requirements(*runtime);
        if (!problem.empty())
            throw engine::error(F("Container backend unavailable: %s") %
                                problem);
        return std::shared_ptr< backend >(new sandbox(runtime, settings));
    }

    case backend_host:
        LI("Using the host backend as configured");
        return std::shared_ptr< backend >(new host_executor(settings));

    case backend_auto: {
        const std::string problem = check_requirements(*runtime);
        if (problem.empty())
            return std::shared_ptr< backend >(new sandbox(runtime, settings));
        LW(F("Falling back to the host backend: %s") % problem);
        return std::shared_ptr< backend >(new host_executor(settings));
    }
    }
    UNREACHABLE;
}
