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

#include "utils/format/formatter.hpp"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <string>

#include "utils/format/exceptions.hpp"
#include "utils/sanity.hpp"

namespace format = utils::format;

using utils::format::bad_format_error;
using utils::format::extra_args_error;
using utils::format::formatter;


namespace {


/// Conversion specifiers accepted after a percent sign.
static const std::string valid_formatters = "cdfsu";


/// Parses the placeholder that starts at a given position.
///
/// \param text The string being parsed.
/// \param pos Position of the percent sign that starts the placeholder.
/// \param [out] length Length of the placeholder, including the percent sign.
/// \param [out] precision Precision requested by the placeholder, or -1.
///
/// \return True if the placeholder is valid; false otherwise.
static bool
parse_placeholder(const std::string& text, const std::string::size_type pos,
                  std::string::size_type& length, int& precision)
{
    PRE(text[pos] == '%');
    std::string::size_type current = pos + 1;
    precision = -1;

    if (current < text.length() && text[current] == '.') {
        current++;
        const std::string::size_type digits_start = current;
        while (current < text.length() &&
               std::isdigit(static_cast< unsigned char >(text[current])))
            current++;
        if (current == digits_start || current >= text.length() ||
            text[current] != 'f')
            return false;
        precision = std::atoi(text.substr(digits_start,
                                          current - digits_start).c_str());
    } else if (current >= text.length() ||
               valid_formatters.find(text[current]) == std::string::npos) {
        return false;
    }

    length = current - pos + 1;
    return true;
}


}  // anonymous namespace


/// Constructs a new formatter object (internal).
///
/// \param format The format string.
/// \param expansion The format string with any replacements performed so far.
/// \param last_pos The position from which to start looking for formatting
///     placeholders.  This must be maintained in case one of the replacements
///     introduced a new placeholder, which must be ignored.  Think, for
///     example, replacing a "%s" string with "foo %s".
formatter::formatter(const std::string& format, const std::string& expansion,
                     const std::string::size_type last_pos) :
    _format(format),
    _expansion(expansion)
{
    locate_placeholder(last_pos);
}


/// Constructs a new formatter object.
///
/// \param format The format string.
///
/// \throw bad_format_error If the format string is invalid.
formatter::formatter(const std::string& format) :
    _format(format),
    _expansion(format)
{
    std::string::size_type pos = 0;
    while (pos < _format.length()) {
        if (_format[pos] == '%') {
            if (pos == _format.length() - 1)
                throw bad_format_error(_format, "Trailing %");
            if (_format[pos + 1] == '%') {
                pos += 2;
                continue;
            }
            std::string::size_type length;
            int precision;
            if (!parse_placeholder(_format, pos, length, precision))
                throw bad_format_error(_format, "Unknown sequence '" +
                                       _format.substr(pos, 2) + "'");
            pos += length;
        } else
            pos++;
    }

    locate_placeholder(0);
}


/// Finds the next placeholder in the expansion, starting at a position.
///
/// \param from The position in _expansion from which to start searching.
void
formatter::locate_placeholder(const std::string::size_type from)
{
    _placeholder = _expansion.find('%', from);
    while (_placeholder != std::string::npos) {
        INV(_placeholder < _expansion.length() - 1);
        if (_expansion[_placeholder + 1] != '%')
            break;
        _placeholder = _expansion.find('%', _placeholder + 2);
    }

    _placeholder_length = 0;
    _precision = -1;
    if (_placeholder != std::string::npos) {
        const bool valid = parse_placeholder(_expansion, _placeholder,
                                             _placeholder_length, _precision);
        INV(valid);
    }
}


/// Configures a stream to honor the flags of the next placeholder.
///
/// \param output The stream into which the argument will be formatted.
void
formatter::prepare_stream(std::ostream& output) const
{
    if (_precision >= 0)
        output << std::fixed << std::setprecision(_precision);
}


/// Returns the formatted string.
///
/// \return A string representation of the formatted string.
std::string
formatter::str(void) const
{
    std::string out = _expansion;

    std::string::size_type pos = out.find("%%");
    while (pos != std::string::npos) {
        out.erase(pos, 1);
        pos = out.find("%%", pos + 1);
    }

    return out;
}


/// Automatic conversion of formatter objects to strings.
///
/// This is provided to allow painless injection of formatter objects into
/// streams, without having to manually call the str() method.
formatter::operator std::string(void) const
{
    return str();
}


/// Specialization of operator% for booleans.
///
/// \param value The boolean to inject into the format string.
///
/// \return A new formatter that has one less format placeholder.
formatter
formatter::operator%(const bool& value) const
{
    return replace(value ? "true" : "false");
}


/// Replaces the first formatting placeholder with a value.
///
/// \param arg The replacement string.
///
/// \return A new formatter in which the first formatting placeholder has been
///     replaced by arg and is ready to replace the next item.
///
/// \throw utils::format::extra_args_error If there are no more formatting
///     placeholders in the input string.
formatter
formatter::replace(const std::string& arg) const
{
    if (_placeholder == std::string::npos)
        throw extra_args_error(_format, arg);

    const std::string expansion = _expansion.substr(0, _placeholder) + arg +
        _expansion.substr(_placeholder + _placeholder_length);
    return formatter(_format, expansion, _placeholder + arg.length());
}


/// Injects the expansion of a formatter into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The formatter to print.
///
/// \return The output stream.
std::ostream&
format::operator<<(std::ostream& output, const formatter& object)
{
    return (output << object.str());
}
