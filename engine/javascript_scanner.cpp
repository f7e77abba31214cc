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

#include "engine/javascript_scanner.hpp"

#include <cctype>
#include <cstring>

#include "utils/noncopyable.hpp"

namespace javascript = engine::javascript;


namespace {


/// Keywords after which a slash starts a regular expression; NULL-terminated.
static const char* const regexp_keywords[] = {
    "return", "typeof", "instanceof", "in", "of", "new", "delete", "void",
    "throw", "case", "do", "else", "yield", "await", NULL };


/// Types of the lexemes of interest.
enum lexeme_type {
    lexeme_word,
    lexeme_punct,
};


/// A significant lexeme of the program.
struct lexeme {
    /// The type of the lexeme.
    lexeme_type type;

    /// The text of the lexeme.
    std::string text;

    /// Line in which the lexeme appears.
    int line;

    /// Nesting level of the lexeme; brackets share the level of the code
    /// that surrounds them.
    std::size_t depth;

    /// Constructor.
    ///
    /// \param type_ The type of the lexeme.
    /// \param text_ The text of the lexeme.
    /// \param line_ Line in which the lexeme appears.
    /// \param depth_ Number of open brackets before the lexeme.
    lexeme(const lexeme_type type_, const std::string& text_, const int line_,
           const std::size_t depth_) :
        type(type_), text(text_), line(line_), depth(depth_)
    {
    }

    /// Checks if the lexeme is a specific word.
    ///
    /// \param word The word to compare to.
    ///
    /// \return True if the lexeme is the given word.
    bool
    is_word(const char* word) const
    {
        return type == lexeme_word && text == word;
    }

    /// Checks if the lexeme is a specific punctuator.
    ///
    /// \param punct The punctuator to compare to.
    ///
    /// \return True if the lexeme is the given punctuator.
    bool
    is_punct(const char* punct) const
    {
        return type == lexeme_punct && text == punct;
    }
};


/// Checks if a character can be part of an identifier.
///
/// \param c The character to check.
///
/// \return True if c can be part of an identifier or a number.
static bool
is_word_char(const char c)
{
    return std::isalnum(static_cast< unsigned char >(c)) || c == '_' ||
        c == '$' || static_cast< unsigned char >(c) >= 0x80;
}


/// Splits a program into lexemes, dropping comments and literals.
///
/// The scanner is lenient: unterminated literals and comments extend to the
/// end of the input and unbalanced brackets are ignored, as the interpreter
/// reports those problems when it loads the program.
class scanner : utils::noncopyable {
    /// The program text.
    const std::string& _text;

    /// Current position in the text.
    std::string::size_type _pos;

    /// Current line number.
    int _line;

    /// Open brackets; '$' denotes the substitution of a template literal.
    std::vector< char > _brackets;

    /// The lexemes recognized so far.
    std::vector< lexeme > _lexemes;

    /// Checks if a slash at the current position starts a regular expression.
    ///
    /// \return True if the slash cannot be a division operator.
    bool
    slash_starts_regexp(void) const
    {
        if (_lexemes.empty())
            return true;
        const lexeme& previous = _lexemes.back();
        if (previous.type == lexeme_punct)
            return previous.text != ")" && previous.text != "]" &&
                previous.text != "}";
        for (const char* const* iter = regexp_keywords; *iter != NULL;
             ++iter) {
            if (previous.text == *iter)
                return true;
        }
        return false;
    }

    /// Advances over a character, keeping track of line breaks.
    void
    advance(void)
    {
        if (_text[_pos] == '\n')
            _line++;
        _pos++;
    }

    /// Skips a quoted string literal.
    ///
    /// \pre The current position is at the opening quote.
    void
    skip_string(void)
    {
        const char quote = _text[_pos];
        _pos++;
        while (_pos < _text.length() && _text[_pos] != quote &&
               _text[_pos] != '\n') {
            if (_text[_pos] == '\\' && _pos + 1 < _text.length())
                advance();
            advance();
        }
        if (_pos < _text.length() && _text[_pos] == quote)
            _pos++;
    }

    /// Skips the text part of a template literal.
    ///
    /// Stops after the closing backtick or after the opening of a
    /// substitution, in which case the substitution is pushed as a bracket.
    void
    skip_template(void)
    {
        while (_pos < _text.length()) {
            if (_text[_pos] == '\\' && _pos + 1 < _text.length()) {
                advance();
                advance();
            } else if (_text[_pos] == '`') {
                _pos++;
                return;
            } else if (_text.compare(_pos, 2, "${") == 0) {
                _pos += 2;
                _brackets.push_back('$');
                return;
            } else {
                advance();
            }
        }
    }

    /// Skips a regular expression literal.
    ///
    /// \pre The current position is at the opening slash.
    void
    skip_regexp(void)
    {
        bool in_class = false;
        _pos++;
        while (_pos < _text.length() && _text[_pos] != '\n') {
            const char c = _text[_pos];
            if (c == '\\' && _pos + 1 < _text.length()) {
                _pos++;
            } else if (c == '[') {
                in_class = true;
            } else if (c == ']') {
                in_class = false;
            } else if (c == '/' && !in_class) {
                _pos++;
                break;
            }
            _pos++;
        }
        while (_pos < _text.length() && is_word_char(_text[_pos]))
            _pos++;
    }

    /// Skips a comment.
    ///
    /// \pre The current position is at the slash that opens the comment.
    void
    skip_comment(void)
    {
        if (_text[_pos + 1] == '/') {
            while (_pos < _text.length() && _text[_pos] != '\n')
                _pos++;
        } else {
            _pos += 2;
            while (_pos < _text.length() &&
                   _text.compare(_pos, 2, "*/") != 0)
                advance();
            if (_pos < _text.length())
                _pos += 2;
        }
    }

    /// Processes a punctuator.
    void
    punct(void)
    {
        const char c = _text[_pos];
        const std::size_t depth = _brackets.size();

        if (_text.compare(_pos, 2, "=>") == 0) {
            _lexemes.push_back(lexeme(lexeme_punct, "=>", _line, depth));
            _pos += 2;
            return;
        }

        if (c == '(' || c == '[' || c == '{') {
            _brackets.push_back(c);
        } else if (c == ')' || c == ']' || c == '}') {
            if (!_brackets.empty()) {
                const char open = _brackets.back();
                _brackets.pop_back();
                if (c == '}' && open == '$') {
                    _pos++;
                    skip_template();
                    return;
                }
            }
        }
        _lexemes.push_back(lexeme(lexeme_punct, std::string(1, c), _line,
                                  c == ')' || c == ']' || c == '}' ?
                                  _brackets.size() : depth));
        _pos++;
    }

public:
    /// Constructor.
    ///
    /// \param text_ The program text to scan.
    explicit scanner(const std::string& text_) :
        _text(text_), _pos(0), _line(1)
    {
    }

    /// Scans the whole program.
    ///
    /// \return The significant lexemes of the program.
    std::vector< lexeme >
    run(void)
    {
        while (_pos < _text.length()) {
            const char c = _text[_pos];
            if (std::isspace(static_cast< unsigned char >(c))) {
                advance();
            } else if (c == '/' && _pos + 1 < _text.length() &&
                       (_text[_pos + 1] == '/' || _text[_pos + 1] == '*')) {
                skip_comment();
            } else if (c == '/' && slash_starts_regexp()) {
                skip_regexp();
            } else if (c == '\'' || c == '"') {
                skip_string();
                _lexemes.push_back(lexeme(lexeme_word, "\"\"", _line,
                                          _brackets.size()));
            } else if (c == '`') {
                const std::size_t depth = _brackets.size();
                _pos++;
                skip_template();
                _lexemes.push_back(lexeme(lexeme_word, "``", _line, depth));
            } else if (is_word_char(c)) {
                const std::string::size_type start = _pos;
                while (_pos < _text.length() && is_word_char(_text[_pos]))
                    _pos++;
                _lexemes.push_back(lexeme(lexeme_word,
                                          _text.substr(start, _pos - start),
                                          _line, _brackets.size()));
            } else {
                punct();
            }
        }
        return _lexemes;
    }
};


/// Checks if a word is a valid binding name.
///
/// \param item The lexeme to check.
///
/// \return True if the lexeme can name a function.
static bool
is_identifier(const lexeme& item)
{
    return item.type == lexeme_word &&
        !std::isdigit(static_cast< unsigned char >(item.text[0])) &&
        item.text != "\"\"" && item.text != "``";
}


/// Checks if a 'function' keyword starts a declaration statement.
///
/// \param lexemes The lexemes of the program.
/// \param index Index of the 'function' keyword, or of the 'async' keyword
///     that precedes it.
///
/// \return True if the keyword is at the beginning of a statement.
static bool
at_statement_start(const std::vector< lexeme >& lexemes,
                   const std::size_t index)
{
    if (index == 0)
        return true;
    const lexeme& previous = lexemes[index - 1];
    return previous.is_punct(";") || previous.is_punct("}") ||
        previous.is_punct(")") || previous.is_word("export") ||
        previous.is_word("default");
}


/// Finds the punctuator that closes a parenthesis.
///
/// \param lexemes The lexemes of the program.
/// \param open Index of the opening parenthesis.
///
/// \return Index of the closing parenthesis, or lexemes.size() if the
/// parenthesis is not closed.
static std::size_t
closing_paren(const std::vector< lexeme >& lexemes, const std::size_t open)
{
    for (std::size_t i = open + 1; i < lexemes.size(); ++i) {
        if (lexemes[i].is_punct(")") && lexemes[i].depth == lexemes[open].depth)
            return i;
    }
    return lexemes.size();
}


}  // anonymous namespace


/// Constructs a new declaration.
///
/// \param name_ Name bound to the function.
/// \param kind_ How the function was declared.
/// \param is_async_ Whether the function is asynchronous.
/// \param line_ Line in which the declaration starts.
javascript::declaration::declaration(const std::string& name_,
                                     const declaration_kind kind_,
                                     const bool is_async_, const int line_) :
    name(name_), kind(kind_), is_async(is_async_), line(line_)
{
}


/// Collects the function-like declarations at the top level of a program.
///
/// Recognizes function declarations, possibly asynchronous, and variable
/// declarations initialized with a function expression or an arrow function.
///
/// \param code The program text.
///
/// \return The declarations in source order.
javascript::declarations_vector
javascript::top_level_functions(const std::string& code)
{
    const std::vector< lexeme > lexemes = scanner(code).run();
    declarations_vector declarations;

    for (std::size_t i = 0; i < lexemes.size(); ++i) {
        const lexeme& item = lexemes[i];
        if (item.depth != 0 || item.type != lexeme_word)
            continue;

        if (item.is_word("function")) {
            const bool is_async = i > 0 && lexemes[i - 1].is_word("async");
            if (!at_statement_start(lexemes, is_async ? i - 1 : i))
                continue;
            std::size_t j = i + 1;
            if (j < lexemes.size() && lexemes[j].is_punct("*"))
                j++;
            if (j + 1 < lexemes.size() && is_identifier(lexemes[j]) &&
                lexemes[j + 1].is_punct("("))
                declarations.push_back(declaration(
                    lexemes[j].text, declaration_function, is_async,
                    lexemes[is_async ? i - 1 : i].line));
        } else if (item.is_word("const") || item.is_word("let") ||
                   item.is_word("var")) {
            if (i + 3 >= lexemes.size() || !is_identifier(lexemes[i + 1]) ||
                !lexemes[i + 2].is_punct("="))
                continue;
            std::size_t j = i + 3;
            bool is_async = false;
            if (lexemes[j].is_word("async") && j + 1 < lexemes.size() &&
                !lexemes[j + 1].is_punct("=>")) {
                is_async = true;
                j++;
            }

            if (lexemes[j].is_word("function")) {
                declarations.push_back(declaration(
                    lexemes[i + 1].text, declaration_expression, is_async,
                    item.line));
            } else if (is_identifier(lexemes[j]) && j + 1 < lexemes.size() &&
                       lexemes[j + 1].is_punct("=>")) {
                declarations.push_back(declaration(
                    lexemes[i + 1].text, declaration_arrow, is_async,
                    item.line));
            } else if (lexemes[j].is_punct("(")) {
                const std::size_t close = closing_paren(lexemes, j);
                if (close + 1 < lexemes.size() &&
                    lexemes[close + 1].is_punct("=>"))
                    declarations.push_back(declaration(
                        lexemes[i + 1].text, declaration_arrow, is_async,
                        item.line));
            }
        }
    }

    return declarations;
}
