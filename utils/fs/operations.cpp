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

#include "utils/fs/operations.hpp"

extern "C" {
#include <sys/stat.h>

#include <dirent.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;

using utils::none;
using utils::optional;


namespace {


/// Scans a directory and collects the names of its entries.
///
/// Note that this does not raise any file system-related exception on purpose.
/// Errors are logged and reported to the caller in the form of a return value.
///
/// \param directory The directory to scan.
/// \param [out] entries The paths to the entries of the directory, excluding
///     the "." and ".." special entries.
///
/// \return True if the directory could be scanned; false otherwise.
static bool
try_list_directory(const fs::path& directory,
                   std::vector< fs::path >& entries)
{
    DIR* dirp;
retry:
    dirp = ::opendir(directory.c_str());
    if (dirp == NULL) {
        const int original_errno = errno;
        if (original_errno == EINTR)
            goto retry;
        LW(F("Failed to open directory %s: %s") % directory.str() %
           std::strerror(original_errno));
        return false;
    }

    ::dirent* dp;
    while ((dp = ::readdir(dirp)) != NULL) {
        const std::string name = dp->d_name;
        if (name == "." || name == "..")
            continue;
        entries.push_back(directory / name);
    }
    ::closedir(dirp);
    return true;
}


/// Stats a file, without following links.
///
/// Note that this does not raise any file system-related exception on purpose.
/// Errors are logged and reported to the caller in the form of a return value.
///
/// \param path The file to stat.
///
/// \return The stat structure on success; none on failure.
static optional< struct ::stat >
try_stat(const fs::path& path)
{
    struct ::stat sb;

retry:
    if (::lstat(path.c_str(), &sb) == -1) {
        const int original_errno = errno;
        if (original_errno == EINTR)
            goto retry;
        LW(F("Cannot get information about %s: %s") % path %
           std::strerror(original_errno));
        return none;
    } else
        return utils::make_optional(sb);
}


/// Removes a directory or a file.
///
/// Note that this does not raise any file system-related exception on purpose.
/// Errors are logged and reported to the caller in the form of a return value.
///
/// \param path The object to remove.
/// \param is_directory Whether the object is a directory or not.
///
/// \return True on success; false otherwise.
static bool
try_remove(const fs::path& path, const bool is_directory)
{
    const int ret = is_directory ? ::rmdir(path.c_str()) :
        ::unlink(path.c_str());
    if (ret == -1) {
        const int original_errno = errno;
        LW(F("Failed to remove %s %s: %s") %
           (is_directory ? "directory" : "file") % path %
           std::strerror(original_errno));
        return false;
    } else
        return true;
}


/// Makes a directory writable and traversable by its owner.
///
/// The sandboxed programs may leave read-only directories behind; these have
/// to be made accessible before their contents can be removed.
///
/// \param path The directory to unprotect.
///
/// \return True on success; false otherwise.
static bool
try_unprotect(const fs::path& path)
{
    if (::chmod(path.c_str(), 0700) == -1) {
        const int original_errno = errno;
        LW(F("Failed to chmod directory %s: %s") % path %
           std::strerror(original_errno));
        return false;
    } else
        return true;
}


/// Recursively removes a directory or a file without crossing mount points.
///
/// \param current_path The file or directory to clean up.
///
/// \return True on success; false otherwise.
static bool
recursive_cleanup(const fs::path& current_path)
{
    bool ok = true;

    const optional< struct ::stat > current_sb = try_stat(current_path);
    if (!current_sb)
        return false;

    if (S_ISDIR(current_sb.get().st_mode)) {
        INV(!S_ISLNK(current_sb.get().st_mode));
        ok &= try_unprotect(current_path);

        std::vector< fs::path > entries;
        ok &= try_list_directory(current_path, entries);
        for (std::vector< fs::path >::const_iterator iter = entries.begin();
             iter != entries.end(); ++iter)
            ok &= recursive_cleanup(*iter);
        ok &= try_remove(current_path, true);
    } else {
        ok &= try_remove(current_path, false);
    }

    return ok;
}


}  // anonymous namespace


/// Recursively removes a directory or a file.
///
/// \param root The directory or file to remove.
///
/// \throw fs::error If there is a problem removing any directory or file.
void
fs::cleanup(const fs::path& root)
{
    LI(F("Starting cleanup of '%s'") % root.str());

    if (!recursive_cleanup(root)) {
        LW(F("Cleanup of '%s' failed") % root.str());
        throw fs::error(F("Failed to clean up '%s'") % root.str());
    } else
        LI(F("Cleanup of '%s' succeeded") % root.str());
}


/// Queries the path to the current directory.
///
/// \return The path to the current directory.
///
/// \throw fs::error If there is a problem querying the current directory.
fs::path
fs::current_path(void)
{
    char* cwd = ::getcwd(NULL, 0);
    if (cwd == NULL) {
        const int original_errno = errno;
        throw fs::system_error(F("Failed to get current working directory"),
                               original_errno);
    }

    try {
        const fs::path result(cwd);
        std::free(cwd);
        return result;
    } catch (...) {
        std::free(cwd);
        throw;
    }
}


/// Checks if a file exists.
///
/// Be aware that this is racy in the same way as access(2) is.
///
/// \param path The file to check the existance of.
///
/// \return True if the file exists; false otherwise.
bool
fs::exists(const fs::path& path)
{
    return ::access(path.c_str(), F_OK) == 0;
}


/// Locates a file in the PATH.
///
/// \param name The file to locate.
///
/// \return The path to the located file or none if it was not found.  The
/// returned path is always absolute.
optional< fs::path >
fs::find_in_path(const char* name)
{
    const optional< std::string > current_path = utils::getenv("PATH");
    if (!current_path || current_path.get().empty())
        return none;

    std::istringstream path_input(current_path.get() + ":");
    std::string path_component;
    while (std::getline(path_input, path_component, ':').good()) {
        const fs::path candidate = path_component.empty() ?
            fs::path(name) : (fs::path(path_component) / name);
        if (::access(candidate.c_str(), X_OK) == 0) {
            if (candidate.is_absolute())
                return utils::make_optional(candidate);
            else
                return utils::make_optional(candidate.to_absolute());
        }
    }
    return none;
}


/// Locates a program given either by name or by path.
///
/// \param program Name of the program, looked up in the PATH, or a path to
///     it if it contains a slash.
///
/// \return The path to the program or none if it was not found.
optional< fs::path >
fs::find_program(const std::string& program)
{
    if (program.find('/') != std::string::npos)
        return utils::make_optional(fs::path(program));
    return find_in_path(program.c_str());
}


/// Creates a directory.
///
/// \param dir The path to the directory to create.
/// \param mode The permissions for the new directory.
///
/// \throw system_error If the call to mkdir(2) fails.
void
fs::mkdir(const fs::path& dir, const int mode)
{
    if (::mkdir(dir.c_str(), static_cast< mode_t >(mode)) == -1) {
        const int original_errno = errno;
        throw fs::system_error(F("Failed to create directory %s") % dir,
                               original_errno);
    }
}


/// Creates a directory and any missing parents.
///
/// This is separate from the fs::mkdir function to clearly differentiate the
/// libc wrapper from the more complex algorithm implemented here.
///
/// \param dir The path to the directory to create.
/// \param mode The permissions for the new directories.
///
/// \throw system_error If any call to mkdir(2) fails.
void
fs::mkdir_p(const fs::path& dir, const int mode)
{
    try {
        fs::mkdir(dir, mode);
    } catch (const fs::system_error& e) {
        if (e.original_errno() == ENOENT) {
            fs::mkdir_p(dir.branch_path(), mode);
            fs::mkdir(dir, mode);
        } else if (e.original_errno() != EEXIST)
            throw e;
    }
}


/// Creates a temporary directory.
///
/// The temporary directory is created using mkdtemp(3) using the provided
/// template.  This should be most likely used in conjunction with
/// fs::auto_directory.
///
/// \param path_template The template for the temporary path.  Must contain the
///     XXXXXX pattern, which is atomically replaced by a random unique string.
///
/// \return The generated path for the temporary directory.
///
/// \throw fs::system_error If the call to mkdtemp(3) fails.
fs::path
fs::mkdtemp(const path& path_template)
{
    PRE(path_template.str().find("XXXXXX") != std::string::npos);
    std::vector< char > buf(path_template.str().begin(),
                            path_template.str().end());
    buf.push_back('\0');
    if (::mkdtemp(&buf[0]) == NULL) {
        const int original_errno = errno;
        throw fs::system_error(F("Cannot create temporary directory using "
                                 "template %s") % path_template,
                               original_errno);
    }
    return fs::path(&buf[0]);
}


/// Returns the directory in which to place temporary files.
///
/// \return The value of TMPDIR if defined and not empty, or /tmp otherwise.
fs::path
fs::temp_directory(void)
{
    const optional< std::string > tmpdir = utils::getenv("TMPDIR");
    if (tmpdir && !tmpdir.get().empty())
        return fs::path(tmpdir.get());
    return fs::path("/tmp");
}
