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

#include "engine/python_parser.hpp"

#include <cctype>
#include <cstring>
#include <set>
#include <utility>

#include "engine/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/sanity.hpp"

namespace python = engine::python;


namespace {


/// Reserved words of the language; NULL-terminated.
static const char* const keywords[] = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield", NULL };


/// Multi-character operators, longest first; NULL-terminated.
static const char* const long_operators[] = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "**", "//", "<<", ">>",
    "<=", ">=", "==", "!=", "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=",
    "@=", NULL };


/// Single-character operators and delimiters.
static const char single_operators[] = "+-*/%@&|^~<>()[]{},:.;=";


/// Operators that cannot end a statement; NULL-terminated.
static const char* const dangling_operators[] = {
    "+", "-", "*", "/", "//", "%", "**", "@", "<<", ">>", "&", "|", "^", "~",
    "<", ">", "<=", ">=", "==", "!=", "=", "+=", "-=", "*=", "/=", "//=",
    "%=", "**=", "@=", "&=", "|=", "^=", ">>=", "<<=", ".", "->", ":=", ":",
    NULL };


/// Keywords that need an operand on their right; NULL-terminated.
static const char* const dangling_keywords[] = {
    "and", "or", "not", "in", "is", "if", "else", "lambda", NULL };


/// Operators that can start a statement even though they cannot end one.
static const char* const leading_operators[] = { "+", "-", "~", "*", NULL };


/// Checks if a string is in a NULL-terminated table of strings.
///
/// \param table The table to search in.
/// \param word The string to look for.
///
/// \return True if word is in the table.
static bool
in_table(const char* const* table, const std::string& word)
{
    for (const char* const* iter = table; *iter != NULL; ++iter) {
        if (word == *iter)
            return true;
    }
    return false;
}


/// Checks if a word is a reserved word.
///
/// \param word The word to check.
///
/// \return True if the word cannot be used as an identifier.
static bool
is_keyword(const std::string& word)
{
    return in_table(keywords, word);
}


/// Checks if a character can start an identifier.
///
/// \param c The character to check.  Bytes of multibyte sequences are
///     accepted as the interpreter allows non-ASCII identifiers.
///
/// \return True if c can start an identifier.
static bool
is_identifier_start(const char c)
{
    return std::isalpha(static_cast< unsigned char >(c)) || c == '_' ||
        static_cast< unsigned char >(c) >= 0x80;
}


/// Checks if a character can be part of an identifier.
///
/// \param c The character to check.
///
/// \return True if c can be part of an identifier.
static bool
is_identifier_char(const char c)
{
    return is_identifier_start(c) ||
        std::isdigit(static_cast< unsigned char >(c));
}


/// Checks if a word is a valid prefix for a string literal.
///
/// \param word The word to check.
///
/// \return True if the word is a string prefix like 'r' or 'fb'.
static bool
is_string_prefix(const std::string& word)
{
    static const char* const prefixes[] = {
        "r", "u", "b", "f", "br", "rb", "fr", "rf", NULL };
    std::string lower;
    for (std::string::const_iterator iter = word.begin(); iter != word.end();
         ++iter)
        lower += std::tolower(static_cast< unsigned char >(*iter));
    return in_table(prefixes, lower);
}


/// Checks if the text of a number literal is well formed.
///
/// \param text The raw text of the literal.
///
/// \return True if the literal is valid.
static bool
is_valid_number(const std::string& text)
{
    if (text.length() > 2 && text[0] == '0' && std::strchr("xXoObB",
                                                            text[1]) != NULL) {
        for (std::string::size_type i = 2; i < text.length(); ++i) {
            if (!std::isxdigit(static_cast< unsigned char >(text[i])) &&
                text[i] != '_')
                return false;
        }
        return true;
    }

    for (std::string::size_type i = 0; i < text.length(); ++i) {
        const char c = text[i];
        if (std::isdigit(static_cast< unsigned char >(c)) || c == '_' ||
            c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-')
            continue;
        if ((c == 'j' || c == 'J') && i == text.length() - 1)
            continue;
        return false;
    }
    return true;
}


/// Converts source text into a sequence of tokens.
class tokenizer : utils::noncopyable {
    /// The source text.
    const std::string& _text;

    /// Current position in the source text.
    std::string::size_type _pos;

    /// Current line number.
    int _line;

    /// Stack of indentation columns of the open blocks.
    std::vector< int > _indents;

    /// Stack of open brackets and the lines in which they were opened.
    std::vector< std::pair< char, int > > _brackets;

    /// Whether the next character is at the beginning of a logical line.
    bool _at_line_start;

    /// Whether the current logical line has produced any token.
    bool _line_has_tokens;

    /// The tokens recognized so far.
    python::tokens_vector _tokens;

    /// Appends a token to the output.
    ///
    /// \param type The type of the token.
    /// \param text The text of the token.
    /// \param line The line in which the token starts.
    void
    emit(const python::token_type type, const std::string& text,
         const int line)
    {
        _tokens.push_back(python::token(type, text, line));
        if (type != python::token_newline && type != python::token_indent &&
            type != python::token_dedent)
            _line_has_tokens = true;
    }

    /// Processes the indentation of a physical line.
    ///
    /// Lines that are blank or only have a comment are consumed entirely and
    /// do not affect the indentation.
    ///
    /// \throw engine::syntax_error If the indentation is inconsistent.
    void
    process_indentation(void)
    {
        int column = 0;
        while (_pos < _text.length()) {
            const char c = _text[_pos];
            if (c == ' ')
                column++;
            else if (c == '\t')
                column = (column / 8 + 1) * 8;
            else if (c != '\f' && c != '\r')
                break;
            _pos++;
        }

        if (_pos >= _text.length())
            return;
        if (_text[_pos] == '#' || _text[_pos] == '\n') {
            while (_pos < _text.length() && _text[_pos] != '\n')
                _pos++;
            if (_pos < _text.length()) {
                _pos++;
                _line++;
            }
            return;
        }

        _at_line_start = false;
        if (column > _indents.back()) {
            _indents.push_back(column);
            emit(python::token_indent, "", _line);
        } else {
            while (column < _indents.back()) {
                _indents.pop_back();
                emit(python::token_dedent, "", _line);
            }
            if (column != _indents.back())
                throw engine::syntax_error("unindent does not match any outer "
                                           "indentation level", _line);
        }
    }

    /// Processes a line break.
    void
    newline(void)
    {
        if (_brackets.empty()) {
            if (_line_has_tokens)
                emit(python::token_newline, "", _line);
            _line_has_tokens = false;
            _at_line_start = true;
        }
        _pos++;
        _line++;
    }

    /// Processes an explicit line continuation.
    ///
    /// \throw engine::syntax_error If the backslash is misplaced.
    void
    continuation(void)
    {
        std::string::size_type next = _pos + 1;
        if (next < _text.length() && _text[next] == '\r')
            next++;
        if (next >= _text.length())
            throw engine::syntax_error("unexpected EOF while parsing", _line);
        if (_text[next] != '\n')
            throw engine::syntax_error("unexpected character after line "
                                       "continuation character", _line);
        _pos = next + 1;
        _line++;
    }

    /// Processes a string literal.
    ///
    /// \param start Position of the first character of the literal,
    ///     including its prefix.
    ///
    /// \pre The current position is at the opening quote.
    ///
    /// \throw engine::syntax_error If the literal is not terminated.
    void
    string(const std::string::size_type start)
    {
        const int start_line = _line;
        const char quote = _text[_pos];
        const std::string triple(3, quote);

        if (_text.compare(_pos, 3, triple) == 0) {
            _pos += 3;
            while (_pos < _text.length()) {
                const char c = _text[_pos];
                if (c == '\\') {
                    if (_pos + 1 < _text.length() && _text[_pos + 1] == '\n')
                        _line++;
                    _pos += 2;
                } else if (_text.compare(_pos, 3, triple) == 0) {
                    _pos += 3;
                    emit(python::token_string,
                         _text.substr(start, _pos - start), start_line);
                    return;
                } else {
                    if (c == '\n')
                        _line++;
                    _pos++;
                }
            }
            throw engine::syntax_error(
                F("unterminated triple-quoted string literal (detected at "
                  "line %s)") % _line, start_line);
        }

        _pos++;
        while (_pos < _text.length()) {
            const char c = _text[_pos];
            if (c == '\\') {
                if (_pos + 1 < _text.length() && _text[_pos + 1] == '\n')
                    _line++;
                _pos += 2;
            } else if (c == quote) {
                _pos++;
                emit(python::token_string, _text.substr(start, _pos - start),
                     start_line);
                return;
            } else if (c == '\n') {
                break;
            } else {
                _pos++;
            }
        }
        throw engine::syntax_error(
            F("unterminated string literal (detected at line %s)") %
            start_line, start_line);
    }

    /// Processes an identifier, a keyword or a prefixed string literal.
    void
    name_or_string(void)
    {
        const std::string::size_type start = _pos;
        while (_pos < _text.length() && is_identifier_char(_text[_pos]))
            _pos++;
        const std::string word = _text.substr(start, _pos - start);

        if (_pos < _text.length() &&
            (_text[_pos] == '\'' || _text[_pos] == '"') &&
            is_string_prefix(word))
            string(start);
        else
            emit(python::token_name, word, _line);
    }

    /// Processes a number literal.
    ///
    /// \throw engine::syntax_error If the literal is malformed.
    void
    number(void)
    {
        const std::string::size_type start = _pos;
        while (_pos < _text.length()) {
            const char c = _text[_pos];
            if ((c == 'e' || c == 'E') && _pos + 1 < _text.length() &&
                (_text[_pos + 1] == '+' || _text[_pos + 1] == '-') &&
                _text.compare(start, 2, "0x") != 0 &&
                _text.compare(start, 2, "0X") != 0) {
                _pos += 2;
            } else if (is_identifier_char(c) || c == '.') {
                _pos++;
            } else {
                break;
            }
        }

        const std::string text = _text.substr(start, _pos - start);
        if (!is_valid_number(text))
            throw engine::syntax_error("invalid decimal literal", _line);
        emit(python::token_number, text, _line);
    }

    /// Processes an operator or a delimiter.
    ///
    /// \throw engine::syntax_error If the character is not valid or if it
    ///     closes a bracket that was not open.
    void
    op(void)
    {
        for (const char* const* iter = long_operators; *iter != NULL;
             ++iter) {
            const std::string::size_type length = std::strlen(*iter);
            if (_text.compare(_pos, length, *iter) == 0) {
                emit(python::token_op, *iter, _line);
                _pos += length;
                return;
            }
        }

        const char c = _text[_pos];
        if (std::strchr(single_operators, c) == NULL || c == '\0')
            throw engine::syntax_error(F("invalid character '%s'") % c,
                                       _line);

        if (c == '(' || c == '[' || c == '{') {
            _brackets.push_back(std::make_pair(c, _line));
        } else if (c == ')' || c == ']' || c == '}') {
            if (_brackets.empty())
                throw engine::syntax_error(F("unmatched '%s'") % c, _line);
            const char open = _brackets.back().first;
            if ((c == ')' && open != '(') || (c == ']' && open != '[') ||
                (c == '}' && open != '{'))
                throw engine::syntax_error(
                    F("closing parenthesis '%s' does not match opening "
                      "parenthesis '%s'") % c % open, _line);
            _brackets.pop_back();
        }

        emit(python::token_op, std::string(1, c), _line);
        _pos++;
    }

public:
    /// Constructor.
    ///
    /// \param text_ The source text to tokenize.
    explicit tokenizer(const std::string& text_) :
        _text(text_),
        _pos(0),
        _line(1),
        _at_line_start(true),
        _line_has_tokens(false)
    {
        _indents.push_back(0);
    }

    /// Tokenizes the whole source text.
    ///
    /// \return The sequence of tokens, terminated by a token_end.
    ///
    /// \throw engine::syntax_error If the text cannot be tokenized.
    python::tokens_vector
    run(void)
    {
        while (_pos < _text.length()) {
            if (_at_line_start && _brackets.empty()) {
                process_indentation();
                continue;
            }

            const char c = _text[_pos];
            if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
                _pos++;
            } else if (c == '#') {
                while (_pos < _text.length() && _text[_pos] != '\n')
                    _pos++;
            } else if (c == '\\') {
                continuation();
            } else if (c == '\n') {
                newline();
            } else if (c == '\'' || c == '"') {
                string(_pos);
            } else if (std::isdigit(static_cast< unsigned char >(c)) ||
                       (c == '.' && _pos + 1 < _text.length() &&
                        std::isdigit(static_cast< unsigned char >(
                            _text[_pos + 1])))) {
                number();
            } else if (is_identifier_start(c)) {
                name_or_string();
            } else {
                op();
            }
        }

        if (!_brackets.empty())
            throw engine::syntax_error(F("'%s' was never closed") %
                                       _brackets.back().first,
                                       _brackets.back().second);
        if (_line_has_tokens)
            emit(python::token_newline, "", _line);
        while (_indents.size() > 1) {
            _indents.pop_back();
            emit(python::token_dedent, "", _line);
        }
        emit(python::token_end, "", _line);
        return _tokens;
    }
};


/// Checks if a token can be the last token of an operand.
///
/// \param tok The token to check.
///
/// \return True if the token ends an operand.
static bool
ends_operand(const python::token& tok)
{
    switch (tok.type) {
    case python::token_name:
        return !is_keyword(tok.text) || tok.text == "True" ||
            tok.text == "False" || tok.text == "None";
    case python::token_number:
    case python::token_string:
        return true;
    case python::token_op:
        return tok.text == ")" || tok.text == "]" || tok.text == "}" ||
            tok.text == "...";
    default:
        return false;
    }
}


/// Checks if a token can start an operand right after another token.
///
/// \param tok The token to check.
/// \param previous The token that precedes tok.
///
/// \return True if the token starts an operand.  Adjacent string literals
/// are concatenated, so a string after a string is not a new operand.
static bool
starts_operand(const python::token& tok, const python::token& previous)
{
    switch (tok.type) {
    case python::token_name:
        return !is_keyword(tok.text) || tok.text == "True" ||
            tok.text == "False" || tok.text == "None";
    case python::token_number:
        return true;
    case python::token_string:
        return previous.type != python::token_string;
    case python::token_op:
        return tok.text == "{" || tok.text == "...";
    default:
        return false;
    }
}


/// Checks if a token is an operator that needs operands on both sides.
///
/// \param tok The token to check.
///
/// \return True if the token is such an operator.  Colons are excluded as
/// they also delimit slices, where they can appear next to each other.
static bool
is_binary_operator(const python::token& tok)
{
    return tok.type == python::token_op && tok.text != ":" &&
        in_table(dangling_operators, tok.text);
}


/// Finds the bracket that closes an open bracket.
///
/// \param tokens The tokens of the logical line.
/// \param open Index of the open bracket.
///
/// \return Index of the closing bracket.
static std::size_t
matching_bracket(const python::tokens_vector& tokens, const std::size_t open)
{
    int depth = 0;
    for (std::size_t i = open; i < tokens.size(); ++i) {
        const python::token& tok = tokens[i];
        if (tok.is_op("(") || tok.is_op("[") || tok.is_op("{"))
            depth++;
        else if (tok.is_op(")") || tok.is_op("]") || tok.is_op("}")) {
            depth--;
            if (depth == 0)
                return i;
        }
    }
    UNREACHABLE_MSG("The tokenizer guarantees balanced brackets");
}


/// Splits a range of tokens on a separator at the outermost nesting level.
///
/// \param tokens The tokens of the logical line.
/// \param begin First token of the range.
/// \param end One past the last token of the range.
/// \param separator The separator operator.
///
/// \return The [begin, end) ranges of the pieces.
static std::vector< std::pair< std::size_t, std::size_t > >
split_tokens(const python::tokens_vector& tokens, const std::size_t begin,
             const std::size_t end, const char* separator)
{
    std::vector< std::pair< std::size_t, std::size_t > > pieces;
    int depth = 0;
    std::size_t start = begin;
    for (std::size_t i = begin; i < end; ++i) {
        const python::token& tok = tokens[i];
        if (tok.is_op("(") || tok.is_op("[") || tok.is_op("{"))
            depth++;
        else if (tok.is_op(")") || tok.is_op("]") || tok.is_op("}"))
            depth--;
        else if (depth == 0 && tok.is_op(separator)) {
            pieces.push_back(std::make_pair(start, i));
            start = i + 1;
        }
    }
    pieces.push_back(std::make_pair(start, end));
    return pieces;
}


/// Finds the colon that terminates the header of a compound statement.
///
/// \param tokens The tokens of the logical line.
/// \param begin Index of the first token after the keyword.
///
/// \return The index of the colon, or tokens.size() if there is none.
static std::size_t
find_header_colon(const python::tokens_vector& tokens,
                  const std::size_t begin)
{
    int depth = 0;
    int pending_lambdas = 0;
    for (std::size_t i = begin; i < tokens.size(); ++i) {
        const python::token& tok = tokens[i];
        if (tok.is_op("(") || tok.is_op("[") || tok.is_op("{"))
            depth++;
        else if (tok.is_op(")") || tok.is_op("]") || tok.is_op("}"))
            depth--;
        else if (depth == 0 && tok.is_name("lambda"))
            pending_lambdas++;
        else if (depth == 0 && tok.is_op(":")) {
            if (pending_lambdas == 0)
                return i;
            pending_lambdas--;
        }
    }
    return tokens.size();
}


/// Builds the description of a statement used in indentation errors.
///
/// \param keyword The keyword that introduced the statement.
///
/// \return A description like "'if' statement" or "function definition".
static std::string
describe_statement(const std::string& keyword)
{
    if (keyword == "def")
        return "function definition";
    else if (keyword == "class")
        return "class definition";
    else
        return F("'%s' statement") % keyword;
}


/// Structural parser over a sequence of tokens.
class parser : utils::noncopyable {
    /// The tokens to parse.
    const python::tokens_vector& _tokens;

    /// Index of the next token to process.
    std::size_t _pos;

    /// Returns the next token to process.
    ///
    /// \return A token.
    const python::token&
    current(void) const
    {
        return _tokens[_pos];
    }

    /// Extracts the tokens of the logical line at the current position.
    ///
    /// \post The current position is at the start of the next line.
    ///
    /// \return The tokens of the line, without the terminating newline.
    python::tokens_vector
    logical_line(void)
    {
        python::tokens_vector line;
        while (current().type != python::token_newline &&
               current().type != python::token_end) {
            line.push_back(current());
            _pos++;
        }
        if (current().type == python::token_newline)
            _pos++;
        return line;
    }

    /// Validates a range of tokens that form an expression or a statement.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param begin First token of the range.
    /// \param end One past the last token of the range.
    ///
    /// \throw engine::syntax_error If the tokens cannot form a statement.
    void
    check_expression(const python::tokens_vector& tokens,
                     const std::size_t begin, const std::size_t end) const
    {
        if (begin >= end)
            return;

        const python::token& first = tokens[begin];
        if (first.type == python::token_op &&
            in_table(dangling_operators, first.text) &&
            !in_table(leading_operators, first.text))
            throw engine::syntax_error("invalid syntax", first.line);

        for (std::size_t i = begin; i + 1 < end; ++i) {
            if (ends_operand(tokens[i]) &&
                starts_operand(tokens[i + 1], tokens[i]))
                throw engine::syntax_error("invalid syntax",
                                           tokens[i + 1].line);
            if (is_binary_operator(tokens[i]) &&
                is_binary_operator(tokens[i + 1]) &&
                !in_table(leading_operators, tokens[i + 1].text))
                throw engine::syntax_error("invalid syntax",
                                           tokens[i + 1].line);
        }

        const python::token& last = tokens[end - 1];
        if ((last.type == python::token_op &&
             in_table(dangling_operators, last.text)) ||
            (last.type == python::token_name &&
             in_table(dangling_keywords, last.text)))
            throw engine::syntax_error("invalid syntax", last.line);
    }

    /// Records the calls made within a range of tokens.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param begin First token of the range.
    /// \param end One past the last token of the range.
    /// \param [out] calls The collection to which to append the calls.
    void
    collect_calls(const python::tokens_vector& tokens,
                  const std::size_t begin, const std::size_t end,
                  std::vector< python::node >& calls) const
    {
        for (std::size_t i = begin; i < end; ++i) {
            const python::token& tok = tokens[i];
            if (tok.type != python::token_name || is_keyword(tok.text))
                continue;
            if (i > begin && tokens[i - 1].is_op("."))
                continue;

            std::string callee = tok.text;
            std::size_t j = i;
            while (j + 2 < end && tokens[j + 1].is_op(".") &&
                   tokens[j + 2].type == python::token_name) {
                callee += "." + tokens[j + 2].text;
                j += 2;
            }
            if (j + 1 < end && tokens[j + 1].is_op("("))
                calls.push_back(python::node(python::node_call, callee,
                                             tok.line));
        }
    }

    /// Parses a dotted name like 'os.path'.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param [in,out] pos Index of the first token; advanced past the name.
    /// \param end One past the last token of the range.
    ///
    /// \return The dotted name.
    ///
    /// \throw engine::syntax_error If there is no name at the position.
    std::string
    dotted_name(const python::tokens_vector& tokens, std::size_t& pos,
                const std::size_t end) const
    {
        if (pos >= end || tokens[pos].type != python::token_name ||
            is_keyword(tokens[pos].text))
            throw engine::syntax_error("invalid syntax",
                                       tokens[pos < end ? pos : end - 1].line);
        std::string name = tokens[pos].text;
        pos++;
        while (pos + 1 < end && tokens[pos].is_op(".") &&
               tokens[pos + 1].type == python::token_name) {
            name += "." + tokens[pos + 1].text;
            pos += 2;
        }
        return name;
    }

    /// Parses an optional 'as NAME' clause.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param [in,out] pos Index of the first token; advanced past the
    ///     clause.
    /// \param end One past the last token of the range.
    ///
    /// \return The alias, or an empty string if there was no clause.
    ///
    /// \throw engine::syntax_error If the clause is malformed.
    std::string
    alias(const python::tokens_vector& tokens, std::size_t& pos,
          const std::size_t end) const
    {
        if (pos >= end || !tokens[pos].is_name("as"))
            return "";
        pos++;
        if (pos >= end || tokens[pos].type != python::token_name ||
            is_keyword(tokens[pos].text))
            throw engine::syntax_error("invalid syntax", tokens[pos - 1].line);
        return tokens[pos++].text;
    }

    /// Parses an 'import' statement.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param begin Index of the 'import' keyword.
    /// \param end One past the last token of the statement.
    /// \param [out] body The collection to which to append the imports.
    ///
    /// \throw engine::syntax_error If the statement is malformed.
    void
    parse_import(const python::tokens_vector& tokens, const std::size_t begin,
                 const std::size_t end, std::vector< python::node >& body)
    {
        std::size_t pos = begin + 1;
        for (;;) {
            python::node import(python::node_import,
                                dotted_name(tokens, pos, end),
                                tokens[begin].line);
            const std::string name_alias = alias(tokens, pos, end);
            if (!name_alias.empty())
                import.names.push_back(name_alias);
            body.push_back(import);

            if (pos == end)
                break;
            if (!tokens[pos].is_op(",") || pos + 1 == end)
                throw engine::syntax_error("invalid syntax", tokens[pos].line);
            pos++;
        }
    }

    /// Parses a 'from ... import' statement.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param begin Index of the 'from' keyword.
    /// \param end One past the last token of the statement.
    /// \param [out] body The collection to which to append the import.
    ///
    /// \throw engine::syntax_error If the statement is malformed.
    void
    parse_from(const python::tokens_vector& tokens, const std::size_t begin,
               const std::size_t end, std::vector< python::node >& body)
    {
        const int line = tokens[begin].line;
        std::size_t pos = begin + 1;

        std::string module;
        while (pos < end && (tokens[pos].is_op(".") ||
                             tokens[pos].is_op("..."))) {
            module += tokens[pos].text;
            pos++;
        }
        if (pos < end && !tokens[pos].is_name("import"))
            module += dotted_name(tokens, pos, end);
        if (module.empty() || pos >= end || !tokens[pos].is_name("import"))
            throw engine::syntax_error("invalid syntax", line);
        pos++;

        python::node import(python::node_import_from, module, line);
        if (pos < end && tokens[pos].is_op("*")) {
            import.names.push_back("*");
            pos++;
        } else {
            std::size_t names_end = end;
            const bool parenthesized = pos < end && tokens[pos].is_op("(");
            if (parenthesized) {
                names_end = matching_bracket(tokens, pos);
                pos++;
            }
            for (;;) {
                std::size_t name_pos = pos;
                import.names.push_back(dotted_name(tokens, name_pos,
                                                   names_end));
                pos = name_pos;
                alias(tokens, pos, names_end);
                if (pos == names_end)
                    break;
                if (!tokens[pos].is_op(","))
                    throw engine::syntax_error("invalid syntax",
                                               tokens[pos].line);
                pos++;
                if (pos == names_end) {
                    if (!parenthesized)
                        throw engine::syntax_error(
                            "trailing comma not allowed without surrounding "
                            "parentheses", line);
                    break;
                }
            }
            if (parenthesized)
                pos = names_end + 1;
        }
        if (pos != end)
            throw engine::syntax_error("invalid syntax", tokens[pos].line);
        body.push_back(import);
    }

    /// Parses a sequence of simple statements separated by semicolons.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param begin First token of the range.
    /// \param end One past the last token of the range.
    /// \param [out] body The collection to which to append the statements.
    ///
    /// \throw engine::syntax_error If any statement is malformed.
    void
    parse_simple_statements(const python::tokens_vector& tokens,
                            const std::size_t begin, const std::size_t end,
                            std::vector< python::node >& body)
    {
        const std::vector< std::pair< std::size_t, std::size_t > > pieces =
            split_tokens(tokens, begin, end, ";");
        for (std::size_t i = 0; i < pieces.size(); ++i) {
            const std::size_t first = pieces[i].first;
            const std::size_t last = pieces[i].second;
            if (first == last) {
                if (i > 0 && i == pieces.size() - 1)
                    break;
                throw engine::syntax_error("invalid syntax",
                                           tokens[first < end ? first :
                                                  end - 1].line);
            }

            if (tokens[first].is_name("import")) {
                parse_import(tokens, first, last, body);
            } else if (tokens[first].is_name("from")) {
                parse_from(tokens, first, last, body);
            } else {
                check_expression(tokens, first, last);
                python::node statement(python::node_statement,
                                       tokens[first].text,
                                       tokens[first].line);
                collect_calls(tokens, first, last, statement.children);
                body.push_back(statement);
            }
        }
    }

    /// Parses the body of a compound statement, function or class.
    ///
    /// \param tokens The tokens of the header line.
    /// \param after_colon Index of the first token after the header colon.
    /// \param keyword The keyword that introduced the statement.
    /// \param [in,out] owner The node to which to append the body.
    ///
    /// \throw engine::syntax_error If the body is missing or malformed.
    void
    parse_body(const python::tokens_vector& tokens,
               const std::size_t after_colon, const std::string& keyword,
               python::node& owner)
    {
        if (after_colon < tokens.size()) {
            parse_simple_statements(tokens, after_colon, tokens.size(),
                                    owner.children);
            return;
        }

        if (current().type != python::token_indent)
            throw engine::syntax_error(
                F("expected an indented block after %s on line %s") %
                describe_statement(keyword) % owner.line, current().line);
        _pos++;
        parse_block(owner.children);
    }

    /// Parses the parameter list of a function definition.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param begin First token after the open parenthesis.
    /// \param end Index of the closing parenthesis.
    /// \param [out] function The node in which to store the parameters.
    ///
    /// \throw engine::syntax_error If the parameter list is malformed.
    void
    parse_parameters(const python::tokens_vector& tokens,
                     const std::size_t begin, const std::size_t end,
                     python::node& function) const
    {
        if (begin == end)
            return;

        std::set< std::string > seen;
        const std::vector< std::pair< std::size_t, std::size_t > > pieces =
            split_tokens(tokens, begin, end, ",");
        for (std::size_t i = 0; i < pieces.size(); ++i) {
            std::size_t pos = pieces[i].first;
            const std::size_t last = pieces[i].second;
            if (pos == last) {
                if (i > 0 && i == pieces.size() - 1)
                    break;
                throw engine::syntax_error("invalid syntax", function.line);
            }

            std::string prefix;
            if (tokens[pos].is_op("*") || tokens[pos].is_op("**")) {
                prefix = tokens[pos].text;
                pos++;
                if (pos == last && prefix == "*")
                    continue;
            } else if (tokens[pos].is_op("/") && pos + 1 == last) {
                continue;
            }

            if (pos == last || tokens[pos].type != python::token_name ||
                is_keyword(tokens[pos].text))
                throw engine::syntax_error("invalid syntax", function.line);
            const std::string name = tokens[pos].text;
            if (!seen.insert(name).second)
                throw engine::syntax_error(
                    F("duplicate argument '%s' in function definition") %
                    name, function.line);
            function.names.push_back(prefix + name);
            pos++;

            if (pos < last) {
                if (!tokens[pos].is_op(":") && !tokens[pos].is_op("="))
                    throw engine::syntax_error("invalid syntax",
                                               tokens[pos].line);
                check_expression(tokens, pos + 1, last);
                if (pos + 1 == last)
                    throw engine::syntax_error("invalid syntax",
                                               tokens[pos].line);
            }
        }
    }

    /// Parses a function definition.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param def_index Index of the 'def' keyword.
    /// \param is_async Whether the definition was prefixed by 'async'.
    /// \param [out] body The collection to which to append the function.
    ///
    /// \throw engine::syntax_error If the definition is malformed.
    void
    parse_function(const python::tokens_vector& tokens,
                   const std::size_t def_index, const bool is_async,
                   std::vector< python::node >& body)
    {
        const int line = tokens[def_index].line;
        const std::size_t name_index = def_index + 1;
        if (name_index >= tokens.size() ||
            tokens[name_index].type != python::token_name ||
            is_keyword(tokens[name_index].text))
            throw engine::syntax_error("invalid syntax", line);

        python::node function(python::node_function, tokens[name_index].text,
                              tokens[0].line);
        function.is_async = is_async;

        const std::size_t open = name_index + 1;
        if (open >= tokens.size() || !tokens[open].is_op("("))
            throw engine::syntax_error("expected '('", line);
        const std::size_t close = matching_bracket(tokens, open);
        parse_parameters(tokens, open + 1, close, function);
        collect_calls(tokens, open + 1, close, function.children);

        std::size_t colon = close + 1;
        if (colon < tokens.size() && tokens[colon].is_op("->")) {
            colon = find_header_colon(tokens, close + 2);
            if (colon == close + 2)
                throw engine::syntax_error("invalid syntax", line);
            check_expression(tokens, close + 2, colon);
        }
        if (colon >= tokens.size() || !tokens[colon].is_op(":"))
            throw engine::syntax_error("expected ':'", line);

        parse_body(tokens, colon + 1, "def", function);
        body.push_back(function);
    }

    /// Parses a class definition.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param [out] body The collection to which to append the class.
    ///
    /// \throw engine::syntax_error If the definition is malformed.
    void
    parse_class(const python::tokens_vector& tokens,
                std::vector< python::node >& body)
    {
        const int line = tokens[0].line;
        if (tokens.size() < 2 || tokens[1].type != python::token_name ||
            is_keyword(tokens[1].text))
            throw engine::syntax_error("invalid syntax", line);

        python::node klass(python::node_class, tokens[1].text, line);

        std::size_t colon = 2;
        if (colon < tokens.size() && tokens[colon].is_op("(")) {
            const std::size_t close = matching_bracket(tokens, colon);
            collect_calls(tokens, colon + 1, close, klass.children);
            colon = close + 1;
        }
        if (colon >= tokens.size() || !tokens[colon].is_op(":"))
            throw engine::syntax_error("expected ':'", line);

        parse_body(tokens, colon + 1, "class", klass);
        body.push_back(klass);
    }

    /// Parses a compound statement other than a definition.
    ///
    /// \param tokens The tokens of the logical line.
    /// \param keyword_index Index of the keyword of the statement.
    /// \param is_async Whether the statement was prefixed by 'async'.
    /// \param [out] body The collection to which to append the statement.
    ///
    /// \throw engine::syntax_error If the statement is malformed.
    void
    parse_compound(const python::tokens_vector& tokens,
                   const std::size_t keyword_index, const bool is_async,
                   std::vector< python::node >& body)
    {
        const std::string& keyword = tokens[keyword_index].text;
        const int line = tokens[0].line;

        python::node compound(python::node_compound, keyword, line);
        compound.is_async = is_async;

        const std::size_t colon = find_header_colon(tokens, keyword_index + 1);
        if (colon == tokens.size())
            throw engine::syntax_error("expected ':'", line);
        const bool has_header = colon > keyword_index + 1;
        if (has_header && (keyword == "else" || keyword == "try" ||
                           keyword == "finally"))
            throw engine::syntax_error("expected ':'", line);
        if (!has_header && keyword != "else" && keyword != "try" &&
            keyword != "finally" && keyword != "except")
            throw engine::syntax_error("invalid syntax", line);

        check_expression(tokens, keyword_index + 1, colon);
        collect_calls(tokens, keyword_index + 1, colon, compound.children);

        parse_body(tokens, colon + 1, keyword, compound);
        body.push_back(compound);
    }

    /// Parses a single statement.
    ///
    /// \param [out] body The collection to which to append the statement.
    /// \param [in,out] previous The keyword of the previous compound
    ///     statement in the block, used to validate clauses like 'else'.
    ///
    /// \throw engine::syntax_error If the statement is malformed.
    void
    parse_statement(std::vector< python::node >& body, std::string& previous)
    {
        const python::token& first = current();
        const int line = first.line;
        const std::string keyword = first.type == python::token_name ?
            first.text : "";

        if (previous == "try" && keyword != "except" && keyword != "finally")
            throw engine::syntax_error("expected 'except' or 'finally' block",
                                       line);
        if ((keyword == "elif" && previous != "if" && previous != "elif") ||
            (keyword == "else" && previous != "if" && previous != "elif" &&
             previous != "for" && previous != "while" &&
             previous != "except") ||
            (keyword == "except" && previous != "try" &&
             previous != "except") ||
            (keyword == "finally" && previous != "try" &&
             previous != "except" && previous != "else"))
            throw engine::syntax_error("invalid syntax", line);

        if (first.is_op("@")) {
            const python::tokens_vector tokens = logical_line();
            if (tokens.size() == 1)
                throw engine::syntax_error("invalid syntax", line);
            check_expression(tokens, 1, tokens.size());
            python::node decorator(python::node_statement, "@", line);
            collect_calls(tokens, 1, tokens.size(), decorator.children);
            if (!current().is_name("def") && !current().is_name("class") &&
                !current().is_name("async") && !current().is_op("@"))
                throw engine::syntax_error("invalid syntax", current().line);
            body.push_back(decorator);
            previous.clear();
            return;
        }

        const python::tokens_vector tokens = logical_line();
        INV(!tokens.empty());
        previous.clear();

        if (keyword == "def") {
            parse_function(tokens, 0, false, body);
        } else if (keyword == "class") {
            parse_class(tokens, body);
        } else if (keyword == "async" && tokens.size() > 1 &&
                   tokens[1].is_name("def")) {
            parse_function(tokens, 1, true, body);
        } else if (keyword == "async" && tokens.size() > 1 &&
                   (tokens[1].is_name("for") || tokens[1].is_name("with"))) {
            parse_compound(tokens, 1, true, body);
        } else if (keyword == "if" || keyword == "elif" ||
                   keyword == "else" || keyword == "for" ||
                   keyword == "while" || keyword == "try" ||
                   keyword == "except" || keyword == "finally" ||
                   keyword == "with") {
            parse_compound(tokens, 0, false, body);
            previous = keyword;
        } else if ((keyword == "match" || keyword == "case") &&
                   tokens.size() > 2 &&
                   tokens.back().is_op(":") &&
                   find_header_colon(tokens, 1) == tokens.size() - 1) {
            parse_compound(tokens, 0, false, body);
        } else {
            parse_simple_statements(tokens, 0, tokens.size(), body);
        }
    }

public:
    /// Constructor.
    ///
    /// \param tokens_ The tokens to parse, terminated by a token_end.
    explicit parser(const python::tokens_vector& tokens_) :
        _tokens(tokens_), _pos(0)
    {
        PRE(!_tokens.empty() && _tokens.back().type == python::token_end);
    }

    /// Parses a block of statements until its end.
    ///
    /// \param [out] body The collection to which to append the statements.
    ///
    /// \throw engine::syntax_error If any statement is malformed.
    void
    parse_block(std::vector< python::node >& body)
    {
        std::string previous;
        while (current().type != python::token_dedent &&
               current().type != python::token_end) {
            if (current().type == python::token_indent)
                throw engine::syntax_error("unexpected indent",
                                           current().line);
            parse_statement(body, previous);
        }
        if (previous == "try")
            throw engine::syntax_error("expected 'except' or 'finally' block",
                                       current().line);
        if (current().type == python::token_dedent)
            _pos++;
    }
};


}  // anonymous namespace


/// Constructs a new token.
///
/// \param type_ The type of the token.
/// \param text_ The raw text of the token.
/// \param line_ Line in which the token starts.
python::token::token(const token_type type_, const std::string& text_,
                     const int line_) :
    type(type_), text(text_), line(line_)
{
}


/// Checks if the token is a specific operator.
///
/// \param op The operator to compare to.
///
/// \return True if the token is the given operator.
bool
python::token::is_op(const char* op) const
{
    return type == token_op && text == op;
}


/// Checks if the token is a specific name or keyword.
///
/// \param name The name to compare to.
///
/// \return True if the token is the given name.
bool
python::token::is_name(const char* name) const
{
    return type == token_name && text == name;
}


/// Converts source code into tokens.
///
/// \param text The source code.
///
/// \return The sequence of tokens, always terminated by a token_end.
///
/// \throw engine::syntax_error If the code cannot be tokenized.
python::tokens_vector
python::tokenize(const std::string& text)
{
    tokenizer tok(text);
    return tok.run();
}


/// Constructs a new node.
///
/// \param type_ The type of the node.
/// \param name_ Name associated to the node.
/// \param line_ Line in which the node starts.
python::node::node(const node_type type_, const std::string& name_,
                   const int line_) :
    type(type_), name(name_), is_async(false), line(line_)
{
}


/// Destructor.
python::visitor::~visitor(void)
{
}


/// Parses source code into a syntax tree.
///
/// \param text The source code.
///
/// \return The module node.
///
/// \throw engine::syntax_error If the code is not valid.
python::node
python::parse(const std::string& text)
{
    const tokens_vector tokens = tokenize(text);
    node module(node_module, "", 1);
    parser(tokens).parse_block(module.children);
    return module;
}


/// Visits all the nodes of a tree in source order.
///
/// \param root The node at which to start.
/// \param callback The visitor to apply to each node.
void
python::walk(const node& root, visitor& callback)
{
    callback.visit(root);
    for (std::vector< node >::const_iterator iter = root.children.begin();
         iter != root.children.end(); ++iter)
        walk(*iter, callback);
}
