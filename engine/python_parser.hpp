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

/// \file engine/python_parser.hpp
/// Tokenizer and structural parser for Python source code.
///
/// The parser does not build a full expression tree.  It recognizes the
/// statement structure of a module (function and class definitions, imports,
/// compound statements and their blocks) and the calls made within each
/// statement, which is all the safety screen and the entry point discovery
/// need.  It rejects the syntax errors that would prevent the interpreter
/// from loading the module in the first place.

#if !defined(ENGINE_PYTHON_PARSER_HPP)
#define ENGINE_PYTHON_PARSER_HPP

#include <string>
#include <vector>

namespace engine {
namespace python {


/// Types of the lexical tokens.
enum token_type {
    token_name,
    token_number,
    token_string,
    token_op,
    token_newline,
    token_indent,
    token_dedent,
    token_end,
};


/// Representation of a lexical token.
struct token {
    /// The type of the token.
    token_type type;

    /// The raw text of the token; empty for structural tokens.
    std::string text;

    /// Line in which the token starts.
    int line;

    token(const token_type, const std::string&, const int);

    bool is_op(const char*) const;
    bool is_name(const char*) const;
};


/// Sequence of tokens.
typedef std::vector< token > tokens_vector;


tokens_vector tokenize(const std::string&);


/// Types of the nodes in the syntax tree.
enum node_type {
    node_module,
    node_function,
    node_class,
    node_import,
    node_import_from,
    node_compound,
    node_statement,
    node_call,
};


/// Node of the syntax tree.
///
/// The meaning of the fields depends on the type of the node:
///
/// - node_module: children holds the top-level statements.
/// - node_function: name is the function name, names the parameters (with
///   their '*' or '**' prefix, if any) and children the calls in the
///   parameter list followed by the body.
/// - node_class: name is the class name and children the calls in the base
///   class list followed by the body.
/// - node_import: name is the imported module; names holds its alias, if any.
/// - node_import_from: name is the source module (including leading dots for
///   relative imports) and names the imported symbols.
/// - node_compound: name is the keyword that introduced the statement and
///   children holds the calls in its header followed by its body.
/// - node_statement: children holds the calls made by the statement.
/// - node_call: name is the dotted name of the callee.
struct node {
    /// The type of the node.
    node_type type;

    /// Name associated to the node.
    std::string name;

    /// Secondary names associated to the node.
    std::vector< std::string > names;

    /// Whether the function or compound statement was prefixed by 'async'.
    bool is_async;

    /// Line in which the node starts.
    int line;

    /// Nested nodes, in source order.
    std::vector< node > children;

    node(const node_type, const std::string&, const int);
};


/// Callback interface for walk().
class visitor {
public:
    virtual ~visitor(void);

    /// Processes a node.
    ///
    /// \param node_ The node being visited.
    virtual void visit(const node& node_) = 0;
};


node parse(const std::string&);
void walk(const node&, visitor&);


}  // namespace python
}  // namespace engine

#endif  // !defined(ENGINE_PYTHON_PARSER_HPP)
