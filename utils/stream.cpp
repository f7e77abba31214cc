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

#include "utils/stream.hpp"

#include <fstream>
#include <stdexcept>

#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;


/// Reads the whole contents of a file into memory.
///
/// \param path The file to read.
///
/// \return A plain string containing the raw contents of the file.
///
/// \throw std::runtime_error If the file cannot be opened.
std::string
utils::read_file(const fs::path& path)
{
    std::ifstream input(path.c_str());
    if (!input)
        throw std::runtime_error(F("Failed to open '%s' for read") % path);
    return read_stream(input);
}


/// Reads the whole contents of a stream into memory.
///
/// \param is The input stream from which to read.
///
/// \return A plain string containing the raw contents of the file.
std::string
utils::read_stream(std::istream& is)
{
    std::string buffer;

    char part[1024];
    while (is.good()) {
        is.read(part, sizeof(part));
        INV(static_cast< unsigned long >(is.gcount()) <= sizeof(part));
        buffer.append(part, is.gcount());
    }

    return buffer;
}


/// Creates or replaces a file with the given contents.
///
/// \param path The file to write.
/// \param contents The raw contents to store in the file.
///
/// \throw std::runtime_error If the file cannot be created or written.
void
utils::write_file(const fs::path& path, const std::string& contents)
{
    std::ofstream output(path.c_str(), std::ios::out | std::ios::trunc);
    if (!output)
        throw std::runtime_error(F("Failed to open '%s' for write") % path);
    output << contents;
    output.close();
    if (!output)
        throw std::runtime_error(F("Failed to write '%s'") % path);
    LD(F("Wrote %s bytes to %s") % contents.length() % path);
}
