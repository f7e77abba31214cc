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

/// \file model/execution_request.hpp
/// Definition of the execution_request class.

#if !defined(MODEL_EXECUTION_REQUEST_HPP)
#define MODEL_EXECUTION_REQUEST_HPP

#include <memory>
#include <ostream>
#include <string>

#include "model/language.hpp"
#include "model/resource_limits.hpp"
#include "model/test_case.hpp"
#include "utils/optional.hpp"

namespace model {


/// Representation of a piece of code to be evaluated against test cases.
///
/// Requests are immutable once constructed.  Copies are cheap as they
/// share the internal representation.
class execution_request {
    struct impl;

    /// Pointer to the shared internal implementation.
    std::shared_ptr< impl > _pimpl;

public:
    execution_request(const model::language, const std::string&,
                      const test_cases_vector&,
                      const utils::optional< std::string >& = utils::none,
                      const resource_limits& = resource_limits());
    ~execution_request(void);

    model::language language(void) const;
    const std::string& code(void) const;
    const test_cases_vector& test_cases(void) const;
    const utils::optional< std::string >& entry_point(void) const;
    const resource_limits& limits(void) const;

    execution_request with_limits(const resource_limits&) const;

    bool operator==(const execution_request&) const;
    bool operator!=(const execution_request&) const;
};


std::ostream& operator<<(std::ostream&, const execution_request&);


}  // namespace model

#endif  // !defined(MODEL_EXECUTION_REQUEST_HPP)
