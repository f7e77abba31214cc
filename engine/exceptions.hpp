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

/// \file engine/exceptions.hpp
/// Exception types raised by the engine module.

#if !defined(ENGINE_EXCEPTIONS_HPP)
#define ENGINE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "utils/fs/path.hpp"

namespace engine {


/// Base exception for engine errors.
class error : public std::runtime_error {
public:
    explicit error(const std::string&);
    virtual ~error(void) throw();
};


/// Error while parsing external data.
class format_error : public error {
public:
    explicit format_error(const std::string&);
    virtual ~format_error(void) throw();
};


/// Error in the syntax of candidate source code.
class syntax_error : public error {
    /// Line in which the error was detected.
    int _line;

    /// Description of the error without location information.
    std::string _reason;

public:
    explicit syntax_error(const std::string&, const int);
    virtual ~syntax_error(void) throw();

    int line(void) const;
    const std::string& reason(void) const;
};


/// Error while loading a configuration file.
class load_error : public error {
public:
    /// The file that could not be loaded.
    utils::fs::path file;

    /// Description of the problem.
    std::string reason;

    explicit load_error(const utils::fs::path&, const std::string&);
    virtual ~load_error(void) throw();
};


/// Error reported by the container runtime.
class container_error : public error {
public:
    explicit container_error(const std::string&);
    virtual ~container_error(void) throw();
};


/// Error denoting that a container image is not available.
class image_not_found_error : public container_error {
    /// Name of the missing image.
    std::string _image;

public:
    explicit image_not_found_error(const std::string&);
    virtual ~image_not_found_error(void) throw();

    const std::string& image(void) const;
};


}  // namespace engine


#endif  // !defined(ENGINE_EXCEPTIONS_HPP)
