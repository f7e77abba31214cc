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

#include "model/resource_limits.hpp"

#include <cctype>
#include <limits>

#include "model/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/text/exceptions.hpp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace text = utils::text;


namespace {


/// Default memory ceiling: 128 MiB.
static const uint64_t default_memory_bytes = 128 * 1024 * 1024;


/// Default CPU share: half a core.
static const double default_cpu_share = 0.5;


/// Default wall-clock timeout in seconds.
static const int64_t default_timeout_seconds = 180;


}  // anonymous namespace


/// Constructs the default resource envelope.
model::resource_limits::resource_limits(void) :
    _memory_bytes(default_memory_bytes),
    _cpu_share(default_cpu_share),
    _timeout(default_timeout_seconds, 0),
    _network(false)
{
}


/// Constructs a custom resource envelope.
///
/// \param memory_bytes_ Memory ceiling in bytes.
/// \param cpu_share_ CPU share as a fraction of one core.
/// \param timeout_ Wall-clock deadline.
/// \param network_ Whether networking is enabled.
///
/// \throw model::format_error If any of the limits is out of range.
model::resource_limits::resource_limits(const uint64_t memory_bytes_,
                                        const double cpu_share_,
                                        const datetime::delta& timeout_,
                                        const bool network_) :
    _memory_bytes(memory_bytes_),
    _cpu_share(cpu_share_),
    _timeout(timeout_),
    _network(network_)
{
    if (memory_bytes_ == 0)
        throw format_error("Memory limit must be positive");
    if (!(cpu_share_ > 0))
        throw format_error(F("Invalid CPU share %s; must be positive") %
                           cpu_share_);
    if (timeout_ == datetime::delta())
        throw format_error("Timeout must be positive");
}


/// Parses a memory amount with an optional unit suffix.
///
/// \param raw_value The amount, like "128m", "1g", "512k" or "1048576".
///
/// \return The amount in bytes.
///
/// \throw model::format_error If the amount is invalid.
uint64_t
model::resource_limits::parse_memory(const std::string& raw_value)
{
    if (raw_value.empty())
        throw format_error("Empty memory limit");

    std::string number = raw_value;
    uint64_t multiplier = 1;
    const char suffix = std::tolower(raw_value[raw_value.length() - 1]);
    if (std::isalpha(suffix)) {
        number = raw_value.substr(0, raw_value.length() - 1);
        switch (suffix) {
        case 'b': multiplier = 1; break;
        case 'k': multiplier = 1024; break;
        case 'm': multiplier = 1024 * 1024; break;
        case 'g': multiplier = 1024 * 1024 * 1024; break;
        default:
            throw format_error(F("Unknown memory unit in '%s'") % raw_value);
        }
    }

    if (number.empty() || !std::isdigit(number[0]))
        throw format_error(F("Invalid memory limit '%s'") % raw_value);

    uint64_t amount;
    try {
        amount = text::to_type< uint64_t >(number);
    } catch (const text::value_error& e) {
        throw format_error(F("Invalid memory limit '%s'") % raw_value);
    }
    if (amount == 0)
        throw format_error(F("Invalid memory limit '%s'; must be positive") %
                           raw_value);
    if (amount > std::numeric_limits< uint64_t >::max() / multiplier)
        throw format_error(F("Memory limit '%s' is too large") % raw_value);
    return amount * multiplier;
}


/// \return The memory ceiling in bytes.
uint64_t
model::resource_limits::memory_bytes(void) const
{
    return _memory_bytes;
}


/// \return The CPU share as a fraction of one core.
double
model::resource_limits::cpu_share(void) const
{
    return _cpu_share;
}


/// \return The wall-clock deadline.
const datetime::delta&
model::resource_limits::timeout(void) const
{
    return _timeout;
}


/// \return Whether networking is enabled.
bool
model::resource_limits::network(void) const
{
    return _network;
}


/// Equality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are equal; false otherwise.
bool
model::resource_limits::operator==(const resource_limits& other) const
{
    return (_memory_bytes == other._memory_bytes &&
            _cpu_share == other._cpu_share &&
            _timeout == other._timeout &&
            _network == other._network);
}


/// Inequality comparator.
///
/// \param other The other object to compare this one to.
///
/// \return True if this object and other are different; false otherwise.
bool
model::resource_limits::operator!=(const resource_limits& other) const
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
model::operator<<(std::ostream& output, const resource_limits& object)
{
    output << F("resource_limits{memory_bytes=%s, cpu_share=%s, timeout=%s, "
                "network=%s}")
        % object.memory_bytes() % object.cpu_share() % object.timeout()
        % object.network();
    return output;
}
