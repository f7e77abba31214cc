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

#include "engine/safety.hpp"

#include <algorithm>
#include <stdexcept>

#include "engine/exceptions.hpp"
#include "engine/python_parser.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/text/operations.ipp"

namespace python = engine::python;
namespace text = utils::text;


namespace {


/// Builtins that evaluate arbitrary code; NULL-terminated.
static const char* const dangerous_builtins[] = {
    "eval", "exec", "compile", "__import__", NULL };


/// Functions of the os module that run or signal processes; NULL-terminated.
static const char* const dangerous_os_functions[] = {
    "system", "popen", "fork", "forkpty", "kill", "killpg", NULL };


/// Prefixes of families of process-creating os functions; NULL-terminated.
static const char* const dangerous_os_prefixes[] = {
    "exec", "spawn", "posix_spawn", NULL };


/// Functions of the subprocess module; NULL-terminated.
static const char* const dangerous_subprocess_functions[] = {
    "call", "run", "Popen", "check_call", "check_output", "getoutput",
    "getstatusoutput", NULL };


/// Modules whose only purpose is process or system control; NULL-terminated.
static const char* const dangerous_modules[] = {
    "os", "subprocess", "sys", "pty", "ctypes", "multiprocessing", NULL };


/// Checks if a string is in a NULL-terminated table.
///
/// \param table The table to search in.
/// \param word The string to look for.
///
/// \return True if the string is in the table.
static bool
in_table(const char* const* table, const std::string& word)
{
    for (const char* const* iter = table; *iter != NULL; ++iter) {
        if (word == *iter)
            return true;
    }
    return false;
}


/// Checks if a string starts with any of the prefixes in a table.
///
/// \param table The NULL-terminated table of prefixes.
/// \param word The string to check.
///
/// \return True if any prefix matches.
static bool
has_prefix(const char* const* table, const std::string& word)
{
    for (const char* const* iter = table; *iter != NULL; ++iter) {
        if (text::starts_with(word, *iter))
            return true;
    }
    return false;
}


/// Checks if a call is to a dangerous function.
///
/// \param callee Dotted name of the called function.
///
/// \return True if the call must be flagged.
static bool
is_dangerous_call(const std::string& callee)
{
    const std::vector< std::string > parts = text::split(callee, '.');
    if (parts.size() == 1)
        return in_table(dangerous_builtins, parts[0]);
    if (parts.size() != 2)
        return false;

    if (parts[0] == "os")
        return in_table(dangerous_os_functions, parts[1]) ||
            has_prefix(dangerous_os_prefixes, parts[1]);
    else if (parts[0] == "subprocess")
        return in_table(dangerous_subprocess_functions, parts[1]);
    else if (parts[0] == "pty")
        return parts[1] == "spawn";
    else
        return false;
}


/// Visitor that collects the dangerous constructs of a module.
class screener : public python::visitor {
    /// Adds a finding unless it was already recorded.
    ///
    /// \param reason The description of the finding.
    void
    add(const std::string& reason)
    {
        if (std::find(reasons.begin(), reasons.end(), reason) ==
            reasons.end())
            reasons.push_back(reason);
    }

public:
    /// The findings, in source order.
    std::vector< std::string > reasons;

    /// Inspects a node for dangerous constructs.
    ///
    /// \param node_ The node being visited.
    void
    visit(const python::node& node_)
    {
        switch (node_.type) {
        case python::node_call:
            if (is_dangerous_call(node_.name))
                add(F("Use of %s()") % node_.name);
            break;

        case python::node_import:
        case python::node_import_from: {
            const std::string module = text::split(node_.name, '.')[0];
            if (in_table(dangerous_modules, module))
                add(F("Import of %s module") % module);
            break;
        }

        default:
            break;
        }
    }
};


}  // anonymous namespace


/// Constructs a new verdict.
///
/// \param is_safe_ Whether the code passed the screening.
/// \param message_ Human-readable description of the outcome.
/// \param reasons_ Individual findings that made the code unsafe.
engine::safety_verdict::safety_verdict(
    const bool is_safe_, const std::string& message_,
    const std::vector< std::string >& reasons_) :
    is_safe(is_safe_), message(message_), reasons(reasons_)
{
}


/// Screens Python code for dangerous constructs.
///
/// Code that cannot be parsed is reported as unsafe because it cannot be
/// verified.
///
/// \param code The code to screen.
///
/// \return The verdict of the screening.
engine::safety_verdict
engine::check_code(const std::string& code)
{
    try {
        screener visitor;
        python::walk(python::parse(code), visitor);
        if (visitor.reasons.empty())
            return safety_verdict(true, "Code appears safe",
                                  std::vector< std::string >());

        const std::string message = "Potentially unsafe code detected: " +
            text::join(visitor.reasons, ", ");
        LI(message);
        return safety_verdict(false, message, visitor.reasons);
    } catch (const engine::syntax_error& e) {
        LI(F("Code rejected due to syntax error: %s") % e.what());
        return safety_verdict(false, F("Syntax error in code: %s") % e.what(),
                              std::vector< std::string >());
    } catch (const std::exception& e) {
        LW(F("Code analysis failed: %s") % e.what());
        return safety_verdict(false,
                              F("Error analyzing code safety: %s") % e.what(),
                              std::vector< std::string >());
    }
}
