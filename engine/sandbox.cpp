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

#include "engine/sandbox.hpp"

#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

#include "engine/entry_point.hpp"
#include "engine/exceptions.hpp"
#include "engine/harness.hpp"
#include "engine/result_extractor.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/auto_cleaners.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/logging/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace harness = engine::harness;

using utils::optional;


namespace {


/// Releases the resources of a single execution when going out of scope.
class teardown_guard : utils::noncopyable {
    /// Workspace of the execution.
    fs::auto_directory _workspace;

    /// Name of the container, if any.
    std::string _container;

    /// Function to destroy the container, if it may exist.
    std::function< void (void) > _remove_container;

public:
    /// Constructor.
    ///
    /// \param work_directory Directory in which to create the workspace.
    ///
    /// \throw fs::error If the workspace cannot be created.
    explicit teardown_guard(const fs::path& work_directory) :
        _workspace(work_directory, PACKAGE_TARNAME)
    {
    }

    /// Destroys the container; the workspace goes away right after it.
    ~teardown_guard(void)
    {
        if (_remove_container)
            _remove_container();
    }

    /// \return The path to the workspace.
    const fs::path&
    workspace(void) const
    {
        return _workspace.directory();
    }

    /// Records the container that holds the execution.
    ///
    /// The container may or may not exist yet: removal is attempted anyway,
    /// as a runtime operation that fails half-way can leave it behind.
    ///
    /// \param name Name of the container.
    /// \param remove_container Function to destroy the container.
    void
    track(const std::string& name,
          const std::function< void (void) >& remove_container)
    {
        _container = name;
        _remove_container = remove_container;
    }

    /// Forgets about the container, which is known not to exist.
    void
    release(void)
    {
        _remove_container = std::function< void (void) >();
    }

    /// \return The name of the container.
    const std::string&
    container(void) const
    {
        return _container;
    }
};


}  // anonymous namespace


/// Internal implementation of the sandbox.
struct engine::sandbox::impl : utils::noncopyable {
    /// Runtime in which to create the containers.
    std::shared_ptr< container_runtime > runtime;

    /// Configuration of the engine.
    const config settings;

    /// Protects the fields below.
    mutable std::mutex mutex;

    /// Names of the containers created and not yet destroyed.
    std::set< std::string > live;

    /// Generator for the suffix of container names.
    std::mt19937 generator;

    /// Constructor.
    ///
    /// \param runtime_ Runtime in which to create the containers.
    /// \param settings_ Configuration of the engine.
    impl(const std::shared_ptr< container_runtime >& runtime_,
         const config& settings_) :
        runtime(runtime_),
        settings(settings_),
        generator(std::random_device()())
    {
    }

    /// Generates a unique name for a container.
    ///
    /// \param language Language of the code the container will run.
    ///
    /// \return A name of the form corral-LANGUAGE-XXXXXXXX.
    std::string
    new_name(const model::language language)
    {
        std::string name;
        std::lock_guard< std::mutex > lock(mutex);
        do {
            std::ostringstream suffix;
            suffix << std::hex << std::setw(8) << std::setfill('0')
                   << (generator() & 0xffffffffUL);
            name = F("corral-%s-%s") % model::language_name(language) %
                suffix.str();
        } while (live.find(name) != live.end());
        return name;
    }

    /// Destroys a container and forgets about it.
    ///
    /// Containers that cannot be removed remain registered so that cleanup()
    /// can retry later.
    ///
    /// \param name Name of the container.
    void
    remove_container(const std::string& name)
    {
        try {
            runtime->remove(name);
        } catch (const engine::container_error& e) {
            LW(F("Failed to remove container %s: %s") % name % e.what());
            return;
        }
        std::lock_guard< std::mutex > lock(mutex);
        live.erase(name);
    }

    /// Forgets about a container that was never created.
    ///
    /// \param name Name of the container.
    void
    forget_container(const std::string& name)
    {
        std::lock_guard< std::mutex > lock(mutex);
        live.erase(name);
    }

    /// Runs the script of a prepared workspace in a new container.
    ///
    /// The name of the container is registered before asking the runtime to
    /// create it so that cleanup() can find it even if the creation fails
    /// after the runtime made the container.
    ///
    /// \param guard The teardown guard that owns the prepared workspace.
    /// \param language Language of the script in the workspace.
    /// \param limits Resources granted to the execution.
    ///
    /// \return True if the container finished within its deadline; false if
    /// it had to be stopped.
    ///
    /// \throw engine::container_error If the runtime fails.
    bool
    run_container(teardown_guard& guard, const model::language language,
                  const model::resource_limits& limits)
    {
        const container_spec spec(
            new_name(language), settings.image(language), guard.workspace(),
            harness::runner_command(language), limits);

        {
            std::lock_guard< std::mutex > lock(mutex);
            live.insert(spec.name);
        }
        guard.track(spec.name, std::bind(&impl::remove_container, this,
                                         spec.name));
        try {
            runtime->create(spec);
        } catch (const engine::image_not_found_error& e) {
            guard.release();
            forget_container(spec.name);
            throw;
        }
        runtime->start(spec.name);

        const optional< int > exit_code = runtime->wait(spec.name,
                                                        limits.timeout());
        if (!exit_code) {
            try {
                runtime->stop(spec.name);
            } catch (const engine::container_error& e) {
                LW(F("Failed to stop container %s after its deadline: %s") %
                   spec.name % e.what());
            }
            return false;
        }
        LD(F("Container %s exited with code %s") % spec.name %
           exit_code.get());
        return true;
    }
};


/// Constructor.
///
/// \param runtime Runtime in which to create the containers.
/// \param settings Configuration of the engine.
engine::sandbox::sandbox(const std::shared_ptr< container_runtime >& runtime,
                         const config& settings) :
    _pimpl(new impl(runtime, settings))
{
}


/// Destructor.
engine::sandbox::~sandbox(void)
{
}


/// \return The name of the backend.
const char*
engine::sandbox::name(void) const
{
    return "container";
}


/// Checks if the backend can run code of a given language.
///
/// \return True; there is an image for every language.
bool
engine::sandbox::supports(const model::language /* language */) const
{
    return true;
}


/// Runs a request in a container.
///
/// \param request The request to run.
///
/// \return The result of the execution.
model::execution_result
engine::sandbox::execute(const model::execution_request& request)
{
    std::string entry_point;
    try {
        entry_point = entry_point_for(request);
    } catch (const engine::error& e) {
        return model::execution_result::make_error(
            F("Could not identify a function to test: %s") % e.what());
    }

    std::unique_ptr< teardown_guard > guard;
    try {
        guard.reset(new teardown_guard(_pimpl->settings.work_directory));
    } catch (const fs::error& e) {
        return model::execution_result::make_error(
            model::fault_environment,
            F("Failed to create workspace: %s") % e.what());
    }

    try {
        harness::write_workspace(guard->workspace(), request, entry_point);
    } catch (const std::runtime_error& e) {
        return model::execution_result::make_error(
            model::fault_environment,
            F("Failed to prepare workspace: %s") % e.what());
    }

    const model::resource_limits& limits = request.limits();
    try {
        if (!_pimpl->run_container(*guard, request.language(), limits))
            return model::execution_result::make_timeout(
                F("Execution timed out after %s seconds") %
                limits.timeout().to_seconds(), limits.timeout());
    } catch (const engine::image_not_found_error& e) {
        return model::execution_result::make_error(model::fault_environment,
                                                   e.what());
    } catch (const engine::container_error& e) {
        return model::execution_result::make_error(
            model::fault_environment,
            F("Container execution failed: %s") % e.what());
    }

    std::string output;
    try {
        output = _pimpl->runtime->logs(guard->container());
    } catch (const engine::container_error& e) {
        return model::execution_result::make_error(
            model::fault_environment,
            F("Failed to retrieve execution logs: %s") % e.what());
    }
    return engine::extract_result(output, request);
}


/// Runs a program in a container, feeding it its input through stdin.
///
/// \param request The program to run.
///
/// \return The outcome of the program.
model::program_result
engine::sandbox::run_program(const model::program_request& request)
{
    std::unique_ptr< teardown_guard > guard;
    try {
        guard.reset(new teardown_guard(_pimpl->settings.work_directory));
    } catch (const fs::error& e) {
        return model::program_result::make_error(
            model::fault_environment,
            F("Failed to create workspace: %s") % e.what());
    }

    try {
        harness::write_program_workspace(guard->workspace(), request);
    } catch (const std::runtime_error& e) {
        return model::program_result::make_error(
            model::fault_environment,
            F("Failed to prepare workspace: %s") % e.what());
    }

    const model::resource_limits& limits = request.limits();
    try {
        if (!_pimpl->run_container(*guard, request.language(), limits))
            return model::program_result::make_timeout(
                F("Execution timed out after %s seconds") %
                limits.timeout().to_seconds(), limits.timeout());
    } catch (const engine::image_not_found_error& e) {
        return model::program_result::make_error(model::fault_environment,
                                                 e.what());
    } catch (const engine::container_error& e) {
        return model::program_result::make_error(
            model::fault_environment,
            F("Container execution failed: %s") % e.what());
    }

    std::string output;
    try {
        output = _pimpl->runtime->logs(guard->container());
    } catch (const engine::container_error& e) {
        return model::program_result::make_error(
            model::fault_environment,
            F("Failed to retrieve execution logs: %s") % e.what());
    }
    return engine::extract_program_result(output);
}


/// Force-removes any container that was not torn down yet.
void
engine::sandbox::cleanup(void)
{
    std::set< std::string > names;
    {
        std::lock_guard< std::mutex > lock(_pimpl->mutex);
        names = _pimpl->live;
    }
    for (std::set< std::string >::const_iterator iter = names.begin();
         iter != names.end(); ++iter) {
        LI(F("Removing leftover container %s") % *iter);
        _pimpl->remove_container(*iter);
    }
}


/// \return The number of containers created and not yet destroyed.
std::size_t
engine::sandbox::live_containers(void) const
{
    std::lock_guard< std::mutex > lock(_pimpl->mutex);
    return _pimpl->live.size();
}
