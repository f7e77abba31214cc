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

/// \file utils/fs/auto_cleaners.cpp

#include "utils/fs/auto_cleaners.hpp"

#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"

namespace fs = utils::fs;


/// Takes ownership of an existing directory.
///
/// \param directory_ The directory to own.
fs::auto_directory::auto_directory(const path& directory_) :
    _directory(directory_),
    _cleaned(false)
{
}


/// Creates a new uniquely-named directory and takes ownership of it.
///
/// The parent directory is created if it does not exist yet.
///
/// \param parent Directory in which to create the new one.
/// \param prefix Prefix of the basename of the new directory; a random
///     suffix is appended to it.
///
/// \throw fs::error If the parent or the directory cannot be created.
fs::auto_directory::auto_directory(const path& parent,
                                   const std::string& prefix) :
    _directory(parent),
    _cleaned(false)
{
    fs::mkdir_p(parent, 0755);
    _directory = fs::mkdtemp(parent / (prefix + ".XXXXXX"));
    LD(F("Created scratch directory %s") % _directory);
}


/// Removes the owned directory, logging any errors.
fs::auto_directory::~auto_directory(void)
{
    try {
        cleanup();
    } catch (const fs::error& e) {
        LW(F("Failed to remove directory %s: %s") % _directory % e.what());
    }
}


/// \return The path to the owned directory.
const fs::path&
fs::auto_directory::directory(void) const
{
    return _directory;
}


/// Builds the path to an entry of the owned directory.
///
/// \param name Name of the entry, relative to the directory.
///
/// \return The path to the entry.
fs::path
fs::auto_directory::operator/(const std::string& name) const
{
    return _directory / name;
}


/// Recursively removes the owned directory.
///
/// Calling this more than once is a no-op, even if the first call failed.
///
/// \throw fs::error If any entry cannot be removed.
void
fs::auto_directory::cleanup(void)
{
    if (_cleaned)
        return;
    _cleaned = true;
    fs::cleanup(_directory);
}
