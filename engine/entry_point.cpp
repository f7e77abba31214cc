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

#include "engine/entry_point.hpp"

#include "engine/exceptions.hpp"
#include "engine/javascript_scanner.hpp"
#include "engine/python_parser.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace javascript = engine::javascript;
namespace python = engine::python;


namespace {


/// Locates the first top-level synchronous function of a Python module.
///
/// \param code The source code of the module.
///
/// \return The name of the function.
///
/// \throw engine::syntax_error If the code is not valid.
/// \throw engine::error If there is no suitable function.
static std::string
find_python_entry_point(const std::string& code)
{
    const python::node module = python::parse(code);
    for (std::vector< python::node >::const_iterator iter =
             module.children.begin(); iter != module.children.end(); ++iter) {
        if ((*iter).type == python::node_function && !(*iter).is_async)
            return (*iter).name;
    }
    throw engine::error("No function definition found in code");
}


/// Locates the first top-level synchronous function of a JavaScript program.
///
/// \param code The source code of the program.
///
/// \return The name of the function.
///
/// \throw engine::error If there is no suitable function.
static std::string
find_javascript_entry_point(const std::string& code)
{
    const javascript::declarations_vector declarations =
        javascript::top_level_functions(code);
    for (javascript::declarations_vector::const_iterator iter =
             declarations.begin(); iter != declarations.end(); ++iter) {
        if (!(*iter).is_async)
            return (*iter).name;
    }
    throw engine::error("No function definition found in code");
}


}  // anonymous namespace


/// Determines the function of the candidate code to test.
///
/// \param language The language in which the code is written.
/// \param code The candidate code.
///
/// \return The name of the first top-level function of the code.
///
/// \throw engine::syntax_error If the code is not valid.
/// \throw engine::error If the code does not define any function.
std::string
engine::find_entry_point(const model::language language, const std::string& code)
{
    std::string name;
    switch (language) {
    case model::language_python:
        name = find_python_entry_point(code);
        break;
    case model::language_javascript:
        name = find_javascript_entry_point(code);
        break;
    default:
        UNREACHABLE;
    }
    LD(F("Discovered entry point '%s' for %s code") % name % language);
    return name;
}


/// Determines the function to invoke for a request.
///
/// \param request The request to be run.
///
/// \return The entry point declared by the request or, if it declares none,
/// the first top-level function of its code.
///
/// \throw engine::syntax_error If the code has to be inspected and is not
///     valid.
/// \throw engine::error If the code has to be inspected and does not define
///     any function.
std::string
engine::entry_point_for(const model::execution_request& request)
{
    if (request.entry_point())
        return request.entry_point().get();
    return find_entry_point(request.language(), request.code());
}
