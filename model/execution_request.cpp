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

#include "model/execution_request.hpp"

#include <cctype>

#include "model/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/optional.ipp"

using utils::optional;


namespace {


/// Checks whether a string is a valid function name.
///
/// \param name The string to validate.
///
/// \return True if name is an identifier in both supported languages.
static bool
is_identifier(const std::string& name)
{
    if (name.empty())
        return false;
    if (!(std::isalpha(name[0]) || name[0] == '_'))
        return false;
    for (std::string::const_iterator iter = name.begin() + 1;
         iter != name.end(); ++iter) {
        if (!(std::isalnum(*iter) || *iter == '_'))
            return false;
    }
    return true;
}


}  // anonymous namespace


/// Internal implementation for an execution_request.
struct model::execution_request::impl : utils::noncopyable {
    /// Language of the code.
    model::language language;

    /// Source code of the candidate.
    std::string code;

    /// Test cases in execution order.
    test_cases_vector test_cases;

    /// Name of the function to invoke, if declared.
    optional< std::string > entry_point;

    /// Resources granted to the execution.
    resource_limits limits;

    /// Constructor.
    ///
    /// \param language_ Language of the code.
    /// \param code_ Source code of the candidate.
    /// \param test_cases_ Test cases in execution order.
    /// \param entry_point_ Name of the function to invoke, if declared.
    /// \param limits_ Resources granted to the execution.
    impl(const model::language language_, const std::string& code_,
         const test_cases_vector& test_cases_,
         const optional< std::string >& entry_point_,
         const resource_limits& limits_) :
        language(language_),
        code(code_),
        test_cases(test_cases_),
        entry_point(entry_point_),
        limits(limits_)
    {
    }
};


/// Constructs a new execution request.
///
/// \param language_ Language of the code.
/// \param code_ Source code of the candidate.
/// \param test_cases_ Test cases in execution order.
/// \param entry_point_ Name of the function to invoke.  If none, the first
///     top-level function of the code is used.
/// \param limits_ Resources granted to the execution.
///
/// \throw format_error If the entry point is not a valid identifier.
model::execution_request::execution_request(
    const model::language language_,
    const std::string& code_,
    const test_cases_vector& test_cases_,
    const optional< std::string >& entry_point_,
    const resource_limits& limits_) :
    _pimpl(new impl(language_, code_, test_cases_, entry_point_, limits_))
{
    if (entry_point_ && !is_identifier(entry_point_.get()))
        throw format_error(F("Invalid entry point name '%s'") %
                           entry_point_.get());
}


/// Destructor.
model::execution_request::~execution_request(void)
{
}


/// \return The language of the code.
model::language
model::execution_request::language(void) const
{
    return _pimpl->language;
}


/// \return The source code of the candidate.
const std::string&
model::execution_request::code(void) const
{
    return _pimpl->code;
}


/// \return The test cases in execution order.
const model::test_cases_vector&
model::execution_request::test_cases(void) const
{
    return _pimpl->test_cases;
}


/// \return The name of the function to invoke, if declared.
const optional< std::string >&
model::execution_request::entry_point(void) const
{
    return _pimpl->entry_point;
}


/// \return The resources granted to the execution.
const model::resource_limits&
model::execution_request::limits(void) const
{
    return _pimpl->limits;
}


/// Creates a copy of the request with different resource limits.
///
/// \param limits_ The new resource limits.
///
/// \return A new request; this one is left untouched.
model::execution_request
model::execution_request::with_limits(const resource_limits& limits_) const
{
    return execution_request(_pimpl->language, _pimpl->code,
                             _pimpl->test_cases, _pimpl->entry_point,
                             limits_);
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::execution_request::operator==(const execution_request& other) const
{
    if (_pimpl == other._pimpl)
        return true;
    return (_pimpl->language == other._pimpl->language &&
            _pimpl->code == other._pimpl->code &&
            _pimpl->test_cases == other._pimpl->test_cases &&
            _pimpl->entry_point == other._pimpl->entry_point &&
            _pimpl->limits == other._pimpl->limits);
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::execution_request::operator!=(const execution_request& other) const
{
    return !(*this == other);
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
model::operator<<(std::ostream& output, const execution_request& object)
{
    output << F("execution_request{language=%s, test_cases=%s, "
                "entry_point=%s, limits=%s}")
        % object.language() % object.test_cases().size()
        % object.entry_point() % object.limits();
    return output;
}
