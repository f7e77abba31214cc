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

#include "utils/logging/operations.hpp"

extern "C" {
#include <unistd.h>
}

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace logging = utils::logging;

using utils::none;
using utils::optional;


namespace {


/// Protects the state of the module; log entries come from many threads.
static std::mutex mutex;


/// First time recorded by the logging module.
static optional< datetime::timestamp > first_timestamp = none;


/// In-memory record of log entries before persistency is enabled.
static std::vector< std::string > backlog;


/// Stream to the currently open log file.
static std::unique_ptr< std::ofstream > logfile;


/// Name of the calling thread to tag its entries with.
static thread_local std::string thread_name = "main";


/// Constant string to strftime to format timestamps.
static const char* timestamp_format = "%Y%m%d-%H%M%S";


}  // anonymous namespace


/// Generates a standard log name.
///
/// This always adds the same timestamp to the log name for a particular run.
/// Also, the timestamp added to the file name corresponds to the first
/// timestamp recorded by the module; it does not necessarily contain the
/// current value of "now".
///
/// \param logdir The path to the directory in which to place the log.
/// \param progname The name of the program that is generating the log.
///
/// \return The path to the log file.
fs::path
logging::generate_log_name(const fs::path& logdir, const std::string& progname)
{
    std::lock_guard< std::mutex > lock(mutex);
    if (!first_timestamp)
        first_timestamp = datetime::timestamp::now();
    return logdir / (F("%s.%s.log") % progname %
                     first_timestamp.get().strftime(timestamp_format));
}


/// Logs an entry to the log file.
///
/// If the log is not yet set to persistent mode, the entry is recorded in the
/// in-memory backlog.  Otherwise, it is just written to disk.
///
/// Entries look like "TIMESTAMP TYPE PID THREAD FILE:LINE: MESSAGE".
///
/// \param type The type of the entry.  Can be one of: D=debugging, E=error,
///     I=info, W=warning.
/// \param file The file from which the log message is generated.
/// \param line The line from which the log message is generated.
/// \param user_message The raw message to store.
void
logging::log(const char type, const char* file, const int line,
             const std::string& user_message)
{
    PRE(type == 'D' || type == 'E' || type == 'I' || type == 'W');

    const datetime::timestamp now = datetime::timestamp::now();
    const std::string message = F("%s %c %d %s %s:%d: %s") %
        now.strftime(timestamp_format) % type % ::getpid() % thread_name %
        file % line % user_message;

    std::lock_guard< std::mutex > lock(mutex);
    if (!first_timestamp)
        first_timestamp = now;

    if (logfile.get() == NULL)
        backlog.push_back(message);
    else {
        INV(backlog.empty());
        (*logfile) << message << '\n';
        (*logfile).flush();
    }
}


/// Makes the log persistent.
///
/// Calling this function flushes the in-memory log, if any, to disk and sets
/// the logging module to send log entries to disk from this point onwards.
/// There is no way back, and the caller program should execute this function as
/// early as possible to ensure that a crash at startup does not discard too
/// many useful log entries.
///
/// \param path The file to write the logs to.
///
/// \throw std::runtime_error If the given file cannot be created.
void
logging::set_persistency(const fs::path& path)
{
    std::lock_guard< std::mutex > lock(mutex);
    PRE(logfile.get() == NULL);

    std::unique_ptr< std::ofstream > new_logfile(
        new std::ofstream(path.c_str()));
    if (!(*new_logfile))
        throw std::runtime_error(F("Failed to create log file %s") % path);

    for (std::vector< std::string >::const_iterator iter = backlog.begin();
         iter != backlog.end(); iter++)
        (*new_logfile) << *iter << '\n';
    new_logfile->flush();
    backlog.clear();
    logfile.reset(new_logfile.release());
}


/// Sets the name with which the calling thread tags its log entries.
///
/// Threads that never call this are tagged as "main".
///
/// \param name The name of the thread; must not contain spaces.
void
logging::set_thread_name(const std::string& name)
{
    PRE(!name.empty() && name.find(' ') == std::string::npos);
    thread_name = name;
}
