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

#include "engine/docker_runtime.hpp"

#include <cstdlib>

#include "engine/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/exceptions.hpp"
#include "utils/process/status.hpp"
#include "utils/text/exceptions.hpp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace executor = utils::process::executor;
namespace fs = utils::fs;
namespace process = utils::process;
namespace text = utils::text;

using utils::none;
using utils::optional;


/// Default maximum number of processes within a container.
const int engine::detail::default_pids_limit = 64;


namespace {


/// Period of the CPU scheduler quota, in microseconds.
static const long cpu_period = 100000;


/// Checks if the output of a failed command denotes a missing image.
///
/// \param output The output of the docker client.
///
/// \return True if the image does not exist locally.
static bool
is_missing_image(const std::string& output)
{
    return output.find("No such image") != std::string::npos ||
        output.find("No such object") != std::string::npos;
}


/// Checks if the output of a failed command denotes a missing container.
///
/// \param output The output of the docker client.
///
/// \return True if the container does not exist.
static bool
is_missing_container(const std::string& output)
{
    return output.find("No such container") != std::string::npos;
}


}  // anonymous namespace


/// Builds the arguments to the docker client to create a container.
///
/// The container has no network unless explicitly allowed, cannot swap, runs
/// with no capabilities and cannot gain privileges.  The workspace is mounted
/// read/write as the working directory of the entry command.
///
/// \param spec Parameters of the container.
/// \param pids_limit Maximum number of processes within the container.
///
/// \return The arguments to the client, not including the program name.
process::args_vector
engine::detail::create_args(const container_spec& spec, const int pids_limit)
{
    const std::string memory = F("%s") % spec.limits.memory_bytes();
    const long cpu_quota = static_cast< long >(
        spec.limits.cpu_share() * cpu_period);

    process::args_vector args;
    args.push_back("create");
    args.push_back("--name");
    args.push_back(spec.name);
    args.push_back("--memory");
    args.push_back(memory);
    args.push_back("--memory-swap");
    args.push_back(memory);
    args.push_back("--cpu-period");
    args.push_back(F("%s") % cpu_period);
    args.push_back("--cpu-quota");
    args.push_back(F("%s") % cpu_quota);
    args.push_back("--pids-limit");
    args.push_back(F("%s") % pids_limit);
    if (!spec.limits.network()) {
        args.push_back("--network");
        args.push_back("none");
    }
    args.push_back("--cap-drop");
    args.push_back("ALL");
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");
    args.push_back("-v");
    args.push_back(F("%s:/app:rw") % spec.workspace.to_absolute());
    args.push_back("-w");
    args.push_back("/app");
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}


/// Constructor.
///
/// The client is looked up at construction time but a missing client is only
/// reported when a command is issued.
///
/// \param program_ Name of the docker client or path to it.
/// \param command_timeout_ Deadline for commands other than wait.
/// \param pids_limit_ Maximum number of processes within a container.
engine::docker_runtime::docker_runtime(
    const std::string& program_, const datetime::delta& command_timeout_,
    const int pids_limit_) :
    _program_name(program_),
    _program(fs::find_program(program_)),
    _command_timeout(command_timeout_),
    _pids_limit(pids_limit_)
{
}


/// Runs the docker client.
///
/// \param args Arguments to the client.
/// \param timeout Deadline for the client.
///
/// \return The handle describing the termination of the client.
///
/// \throw engine::container_error If the client cannot be run.
executor::exit_handle
engine::docker_runtime::run_client(const process::args_vector& args,
                                   const datetime::delta& timeout) const
{
    if (!_program)
        throw engine::container_error(F("Cannot find %s in the PATH") %
                                      _program_name);

    LD(F("Running %s %s") % _program.get() % text::join(args, " "));
    try {
        return executor::run(_program.get(), args, timeout);
    } catch (const process::error& e) {
        throw engine::container_error(F("Failed to run %s: %s") %
                                      _program_name % e.what());
    }
}


/// Runs the docker client and requires it to succeed.
///
/// \param args Arguments to the client.
///
/// \return The output of the client.
///
/// \throw engine::container_error If the client fails or times out.
std::string
engine::docker_runtime::run_checked(const process::args_vector& args) const
{
    const executor::exit_handle handle = run_client(args, _command_timeout);
    if (handle.timed_out())
        throw engine::container_error(F("docker %s timed out after %s "
                                        "seconds") % args[0] %
                                      _command_timeout.seconds);
    const process::status& status = handle.status().get();
    if (!status.exited() || status.exitstatus() != EXIT_SUCCESS)
        throw engine::container_error(F("docker %s failed: %s") % args[0] %
                                      text::trim(handle.output()));
    return handle.output();
}


/// Queries the version of the docker daemon.
///
/// \return The version of the server, which requires the daemon to be
/// reachable.
std::string
engine::docker_runtime::version(void)
{
    process::args_vector args;
    args.push_back("version");
    args.push_back("--format");
    args.push_back("{{.Server.Version}}");
    return text::trim(run_checked(args));
}


/// Creates a container.
///
/// \param spec Parameters of the container.
///
/// \throw engine::image_not_found_error If the image is not available
///     locally.  Images are never pulled.
void
engine::docker_runtime::create(const container_spec& spec)
{
    process::args_vector inspect;
    inspect.push_back("image");
    inspect.push_back("inspect");
    inspect.push_back("--format");
    inspect.push_back("{{.Id}}");
    inspect.push_back(spec.image);
    const executor::exit_handle handle = run_client(inspect,
                                                    _command_timeout);
    if (handle.timed_out())
        throw engine::container_error(F("docker image inspect timed out "
                                        "after %s seconds") %
                                      _command_timeout.seconds);
    if (!handle.status().get().exited() ||
        handle.status().get().exitstatus() != EXIT_SUCCESS) {
        if (is_missing_image(handle.output()))
            throw engine::image_not_found_error(spec.image);
        throw engine::container_error(F("docker image inspect failed: %s") %
                                      text::trim(handle.output()));
    }

    (void)run_checked(detail::create_args(spec, _pids_limit));
    LI(F("Created container %s from image %s") % spec.name % spec.image);
}


/// Starts a container in the background.
///
/// \param name Name of the container.
void
engine::docker_runtime::start(const std::string& name)
{
    process::args_vector args;
    args.push_back("start");
    args.push_back(name);
    (void)run_checked(args);
}


/// Waits for a container to terminate.
///
/// \param name Name of the container.
/// \param timeout Maximum time to wait for.
///
/// \return The exit code of the entry command, or none on timeout.
optional< int >
engine::docker_runtime::wait(const std::string& name,
                             const datetime::delta& timeout)
{
    process::args_vector args;
    args.push_back("wait");
    args.push_back(name);
    const executor::exit_handle handle = run_client(args, timeout);
    if (handle.timed_out()) {
        LI(F("Container %s still running after %s seconds") % name %
           timeout.seconds);
        return none;
    }

    const std::string output = text::trim(handle.output());
    if (!handle.status().get().exited() ||
        handle.status().get().exitstatus() != EXIT_SUCCESS)
        throw engine::container_error(F("docker wait failed: %s") % output);
    try {
        return utils::make_optional(text::to_type< int >(output));
    } catch (const text::value_error& e) {
        throw engine::container_error(F("Invalid exit code '%s' for "
                                        "container %s") % output % name);
    }
}


/// Kills a running container.
///
/// \param name Name of the container.
void
engine::docker_runtime::stop(const std::string& name)
{
    process::args_vector args;
    args.push_back("kill");
    args.push_back(name);
    (void)run_checked(args);
}


/// Fetches the combined output of a container.
///
/// \param name Name of the container.
///
/// \return The stdout and stderr of the entry command.
std::string
engine::docker_runtime::logs(const std::string& name)
{
    process::args_vector args;
    args.push_back("logs");
    args.push_back(name);
    return run_checked(args);
}


/// Destroys a container.
///
/// A container that does not exist is not an error: the name may have been
/// registered for cleanup before its creation failed.
///
/// \param name Name of the container.
///
/// \throw engine::container_error If the client fails or times out.
void
engine::docker_runtime::remove(const std::string& name)
{
    process::args_vector args;
    args.push_back("rm");
    args.push_back("--force");
    args.push_back(name);

    const executor::exit_handle handle = run_client(args, _command_timeout);
    if (handle.timed_out())
        throw engine::container_error(F("docker rm timed out after %s "
                                        "seconds") % _command_timeout.seconds);
    const process::status& status = handle.status().get();
    if (!status.exited() || status.exitstatus() != EXIT_SUCCESS) {
        if (!is_missing_container(handle.output()))
            throw engine::container_error(F("docker rm failed: %s") %
                                          text::trim(handle.output()));
        LD(F("Container %s was never created") % name);
        return;
    }
    LD(F("Removed container %s") % name);
}
