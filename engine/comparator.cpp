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

#include "engine/comparator.hpp"

#include <cmath>

#include "utils/sanity.hpp"

namespace json = nlohmann;


const double engine::float_tolerance = 1e-6;


namespace {


/// Categories of values that can be compared with each other.
///
/// Integers and floating point numbers belong to the same category so that
/// 3 and 3.0 can be compared, but booleans do not.
enum category {
    category_null,
    category_boolean,
    category_number,
    category_string,
    category_array,
    category_object,
    category_other,
};


/// Computes the comparison category of a value.
///
/// \param value The value to classify.
///
/// \return The category.
static category
category_of(const json::json& value)
{
    if (value.is_null())
        return category_null;
    else if (value.is_boolean())
        return category_boolean;
    else if (value.is_number())
        return category_number;
    else if (value.is_string())
        return category_string;
    else if (value.is_array())
        return category_array;
    else if (value.is_object())
        return category_object;
    else
        return category_other;
}


/// Compares two numbers.
///
/// \param actual The first number.
/// \param expected The second number.
///
/// \return True if the numbers are equal.  If either of them is a floating
/// point number, they are equal if they are within the tolerance.
static bool
equal_numbers(const json::json& actual, const json::json& expected)
{
    if (actual.is_number_float() || expected.is_number_float())
        return std::fabs(actual.get< double >() - expected.get< double >()) <
            engine::float_tolerance;
    else
        return actual == expected;
}


}  // anonymous namespace


/// Compares an actual output against its expected value.
///
/// Sequences must have the same length and pairwise equal elements.
/// Mappings must have the same keys and pairwise equal values.  Null is
/// only equal to null.  Values of different types are never equal.
///
/// \param actual The value produced by the code.
/// \param expected The value the code should have produced.
///
/// \return True if the values are considered equal.  The relation is
/// symmetric and reflexive.
bool
engine::equal(const json::json& actual, const json::json& expected)
{
    const category actual_category = category_of(actual);
    if (actual_category != category_of(expected))
        return false;

    switch (actual_category) {
    case category_null:
        return true;

    case category_number:
        return equal_numbers(actual, expected);

    case category_array: {
        if (actual.size() != expected.size())
            return false;
        json::json::const_iterator iter2 = expected.begin();
        for (json::json::const_iterator iter = actual.begin();
             iter != actual.end(); ++iter, ++iter2) {
            if (!equal(*iter, *iter2))
                return false;
        }
        return true;
    }

    case category_object: {
        if (actual.size() != expected.size())
            return false;
        for (json::json::const_iterator iter = actual.begin();
             iter != actual.end(); ++iter) {
            const json::json::const_iterator iter2 = expected.find(iter.key());
            if (iter2 == expected.end() || !equal(iter.value(), *iter2))
                return false;
        }
        return true;
    }

    case category_boolean:
    case category_string:
    case category_other:
        return actual == expected;
    }
    UNREACHABLE;
}
