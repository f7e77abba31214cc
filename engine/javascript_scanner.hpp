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

/// \file engine/javascript_scanner.hpp
/// Lexical scanner to locate top-level function declarations in JavaScript.

#if !defined(ENGINE_JAVASCRIPT_SCANNER_HPP)
#define ENGINE_JAVASCRIPT_SCANNER_HPP

#include <string>
#include <vector>

namespace engine {
namespace javascript {


/// Kinds of the function-like declarations recognized by the scanner.
enum declaration_kind {
    declaration_function,
    declaration_expression,
    declaration_arrow,
};


/// A top-level function-like declaration.
struct declaration {
    /// Name bound to the function.
    std::string name;

    /// How the function was declared.
    declaration_kind kind;

    /// Whether the function is asynchronous.
    bool is_async;

    /// Line in which the declaration starts.
    int line;

    declaration(const std::string&, const declaration_kind, const bool,
                const int);
};


/// Sequence of declarations in source order.
typedef std::vector< declaration > declarations_vector;


declarations_vector top_level_functions(const std::string&);


}  // namespace javascript
}  // namespace engine

#endif  // !defined(ENGINE_JAVASCRIPT_SCANNER_HPP)
