/// @file SExpr.hpp
/// S-expression tree (concrete syntax tree) of a problem description.
#pragma once
#include "Lexer.hpp"
#include <string>
#include <vector>

namespace pdo::parser
{

/// A node in an S-expression tree: either an atom or a list.
struct SExpr
{
    bool is_atom = false; ///< True if this node is a leaf atom.
    std::string atom;     ///< Atom text (only when @c is_atom).
    std::vector<SExpr> children; ///< Sub-expressions (only for lists).
    int line = 0;         ///< Source line where this expression starts.
};

/// Check whether @p e is a list whose first child is the atom @p tag.
bool tagged(const SExpr& e, const std::string& tag);

/// Render @p e back to text, e.g. for error messages.
std::string to_text(const SExpr& e);

/// Return the text of an atom, or report that @p what was expected.
const std::string&
expect_atom(const SExpr& e, const Lexer& lex, const std::string& what);

/// Parse one S-expression from the token stream, without recursion.
/// @throws pdo::ParseError on unexpected EOF or mismatched parentheses.
SExpr parse_sexpr(Lexer& lex);

/// Parse exactly one S-expression spanning the whole source.
/// @throws pdo::ParseError if anything but blanks follows it.
SExpr parse_document(Lexer& lex);

} // namespace pdo::parser
