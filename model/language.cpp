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

#include "model/language.hpp"

#include "model/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/text/operations.hpp"

namespace text = utils::text;


/// Parses the name of a language.
///
/// \param name The user-provided name.  Matching is case-insensitive and the
///     alias "js" is accepted for JavaScript.
///
/// \return The language.
///
/// \throw model::format_error If the language is not supported.
model::language
model::language_from_name(const std::string& name)
{
    const std::string lower = text::to_lower(name);
    if (lower == "python")
        return language_python;
    else if (lower == "javascript" || lower == "js")
        return language_javascript;
    else
        throw format_error(F("Unsupported language: %s") % name);
}


/// Returns the canonical name of a language.
///
/// \param lang The language to name.
///
/// \return A lowercase name that language_from_name() accepts.
const char*
model::language_name(const language lang)
{
    switch (lang) {
    case language_python: return "python";
    case language_javascript: return "javascript";
    }
    UNREACHABLE;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param lang The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const language lang)
{
    output << language_name(lang);
    return output;
}
