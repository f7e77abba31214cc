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

#include "utils/process/child.hpp"

extern "C" {
#include <fcntl.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/exceptions.hpp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;
namespace process = utils::process;

using utils::optional;


/// Exit code of a child that failed to set itself up or to execute the binary.
#define EXEC_FAILED_EXIT_CODE 127


/// Private implementation fields for child objects.
struct utils::process::child::impl : utils::noncopyable {
    /// The process identifier.
    pid_t _pid;

    /// Read end of the pipe connected to the stdout and stderr of the process.
    int _output_fd;

    /// Initializes private implementation data.
    ///
    /// \param pid The process identifier.
    /// \param output_fd The read end of the output pipe.  Grabs ownership.
    impl(const pid_t pid, const int output_fd) :
        _pid(pid), _output_fd(output_fd) {}

    /// Releases the output pipe, if still open.
    ~impl(void)
    {
        if (_output_fd != -1)
            ::close(_output_fd);
    }
};


namespace {


/// Writes a message to stderr without going through any buffered stream.
///
/// \param message The message to write.  Must be NULL-terminated.
static void
write_stderr(const char* message)
{
    std::size_t pending = std::strlen(message);
    while (pending > 0) {
        const ssize_t written = ::write(STDERR_FILENO, message, pending);
        if (written <= 0)
            break;
        message += written;
        pending -= written;
    }
}


/// Body of the subprocess spawned by fork_capture().
///
/// This runs right after fork(2) in a possibly-multithreaded parent.  As such,
/// it can only use async-signal-safe functions: all the data it needs must have
/// been prepared in advance by the caller.
///
/// \param output_fd Write end of the output pipe.
/// \param program Path to the binary to execute.
/// \param argv NULL-terminated arguments vector, program name included.
/// \param work_directory Directory to enter before executing the binary, or
///     NULL to stay in the current one.
/// \param exec_error Message to print if the binary cannot be executed.
static void
run_child(const int output_fd, const char* program, char* const* argv,
          const char* work_directory, const char* exec_error) UTILS_NORETURN;
static void
run_child(const int output_fd, const char* program, char* const* argv,
          const char* work_directory, const char* exec_error)
{
    if (::setpgid(::getpid(), ::getpid()) == -1) {
        write_stderr("Failed to set the process group\n");
        ::_exit(EXEC_FAILED_EXIT_CODE);
    }

    if (::dup2(output_fd, STDOUT_FILENO) == -1 ||
        ::dup2(output_fd, STDERR_FILENO) == -1) {
        ::_exit(EXEC_FAILED_EXIT_CODE);
    }
    if (output_fd != STDOUT_FILENO && output_fd != STDERR_FILENO)
        ::close(output_fd);

    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd != -1 && null_fd != STDIN_FILENO) {
        (void)::dup2(null_fd, STDIN_FILENO);
        ::close(null_fd);
    }

    if (work_directory != NULL && ::chdir(work_directory) == -1) {
        write_stderr("Failed to enter the work directory\n");
        ::_exit(EXEC_FAILED_EXIT_CODE);
    }

    ::execv(program, argv);
    write_stderr(exec_error);
    ::_exit(EXEC_FAILED_EXIT_CODE);
}


}  // anonymous namespace


/// Creates a new child.
///
/// \param implptr A dynamically-allocated impl object with the contents of the
///     new child.
process::child::child(impl *implptr) :
    _pimpl(implptr)
{
}


/// Destructor for child.
process::child::~child(void)
{
}


/// Spawns a binary and captures its stdout and stderr, multiplexed.
///
/// If the subprocess cannot be completely set up, it prints an error message
/// to its output channel and exits with code 127, which is the same convention
/// used by shells to report a command that could not be executed.
///
/// \param program Path to the binary to execute.
/// \param args Arguments to the binary, not including the program name.
/// \param work_directory If set, directory to run the binary in.
///
/// \return A new child object, returned as a dynamically-allocated object
/// because children classes are unique and thus noncopyable.
///
/// \throw process::system_error If the process cannot be spawned due to a
///     system call error.
std::unique_ptr< process::child >
process::child::fork_capture(const fs::path& program,
                             const args_vector& args,
                             const optional< fs::path >& work_directory)
{
    // Everything the subprocess needs is prepared before forking.
    std::vector< char* > argv;
    argv.push_back(const_cast< char* >(program.c_str()));
    for (args_vector::const_iterator iter = args.begin(); iter != args.end();
         ++iter)
        argv.push_back(const_cast< char* >((*iter).c_str()));
    argv.push_back(NULL);
    const std::string exec_error = F("Failed to execute %s\n") % program;
    const char* work_directory_cstr =
        work_directory ? work_directory.get().c_str() : NULL;

    std::cout.flush();
    std::cerr.flush();

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1)
        throw process::system_error("pipe2(2) failed", errno);

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int original_errno = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw process::system_error("fork(2) failed", original_errno);
    } else if (pid == 0) {
        ::close(fds[0]);
        run_child(fds[1], program.c_str(), &argv[0], work_directory_cstr,
                  exec_error.c_str());
    }

    ::close(fds[1]);
    LD(F("Spawned process %s for %s: stdout and stderr captured") % pid %
       program);
    return std::unique_ptr< child >(new child(new impl(pid, fds[0])));
}


/// Returns the process identifier of this child.
///
/// \return A process identifier.
int
process::child::pid(void) const
{
    return _pimpl->_pid;
}


/// Reads all the output of the child until it closes its end of the pipe.
///
/// This can only be called once.
///
/// \return The multiplexed stdout and stderr of the child.
///
/// \throw process::system_error If reading from the pipe fails.
std::string
process::child::read_output(void)
{
    PRE(_pimpl->_output_fd != -1);

    std::string output;
    char buffer[4096];
    for (;;) {
        const ssize_t count = ::read(_pimpl->_output_fd, buffer,
                                     sizeof(buffer));
        if (count == -1) {
            if (errno == EINTR)
                continue;
            const int original_errno = errno;
            ::close(_pimpl->_output_fd);
            _pimpl->_output_fd = -1;
            throw process::system_error(
                F("Failed to read output of PID %s") % _pimpl->_pid,
                original_errno);
        } else if (count == 0) {
            break;
        }
        output.append(buffer, count);
    }

    ::close(_pimpl->_output_fd);
    _pimpl->_output_fd = -1;
    return output;
}


/// Blocks to wait for completion.
///
/// \return The termination status of the child process.
///
/// \throw process::system_error If the call to waitpid(2) fails.
process::status
process::child::wait(void)
{
    return process::wait(_pimpl->_pid);
}
