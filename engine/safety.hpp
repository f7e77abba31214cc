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

/// \file engine/safety.hpp
/// Static screening of candidate code for dangerous constructs.
///
/// The screening is advisory: it rejects the obvious attempts to reach the
/// operating system before any execution resource is allocated, but it can
/// be bypassed by indirect means and thus never replaces the isolation
/// provided by the sandbox.

#if !defined(ENGINE_SAFETY_HPP)
#define ENGINE_SAFETY_HPP

#include <string>
#include <vector>

namespace engine {


/// Outcome of screening a piece of code.
struct safety_verdict {
    /// Whether the code passed the screening.
    bool is_safe;

    /// Human-readable description of the outcome.
    std::string message;

    /// Individual findings that made the code unsafe, in source order.
    std::vector< std::string > reasons;

    safety_verdict(const bool, const std::string&,
                   const std::vector< std::string >&);
};


safety_verdict check_code(const std::string&);


}  // namespace engine

#endif  // !defined(ENGINE_SAFETY_HPP)
