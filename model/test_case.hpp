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

/// \file model/test_case.hpp
/// Definition of the test_case class.

#if !defined(MODEL_TEST_CASE_HPP)
#define MODEL_TEST_CASE_HPP

#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/optional.hpp"

namespace model {


/// Representation of a single input/expected-output pair.
///
/// Test cases have no identity of their own: they are identified by their
/// position within the request that carries them.
class test_case {
    /// Value passed to the entry point.
    nlohmann::json _input;

    /// Value the entry point must return.
    nlohmann::json _expected_output;

    /// Whether the test case is hidden from the submitter.
    bool _hidden;

    /// Optional human-readable description of the case.
    utils::optional< std::string > _explanation;

public:
    test_case(const nlohmann::json&, const nlohmann::json&,
              const bool = false,
              const utils::optional< std::string >& = utils::none);

    const nlohmann::json& input(void) const;
    const nlohmann::json& expected_output(void) const;
    bool hidden(void) const;
    const utils::optional< std::string >& explanation(void) const;

    bool operator==(const test_case&) const;
    bool operator!=(const test_case&) const;
};


/// Collection of test cases in execution order.
typedef std::vector< test_case > test_cases_vector;


std::ostream& operator<<(std::ostream&, const test_case&);


}  // namespace model

#endif  // !defined(MODEL_TEST_CASE_HPP)
