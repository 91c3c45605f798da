/// @file Lexer.hpp
/// Tokenizer for problem description files.
///
/// The language has two kinds of token, parentheses and words. A word
/// is any run of printable characters other than parentheses and @c ;
/// (atoms, keywords such as @c :action, numbers such as @c 9/10).
/// A @c ; starts a comment running to the end of the line.
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace pdo::parser
{

enum class TokenKind
{
    Open,  ///< (
    Close, ///< )
    Word,
    End    ///< End of input.
};

struct Token
{
    TokenKind kind = TokenKind::End;
    std::string text; ///< Word content, empty for other kinds.
    int line = 0;     ///< 1-based line where the token starts.
};

/// Cursor over a source buffer, with one token of lookahead.
struct Lexer
{
    std::string_view src; ///< Full source text (must outlive the Lexer).
    std::string filename; ///< Used in error messages.
    size_t pos = 0;
    int line = 1;
    std::optional<Token> lookahead{};
};

/// Throw a pdo::ParseError formatted as @c file:line: message.
[[noreturn]] void
parse_error(const Lexer& lex, int err_line, const std::string& msg);

/// Consume and return the next token.
/// @throws pdo::ParseError on a control character inside a word.
Token next_token(Lexer& lex);

/// Return the next token without consuming it.
const Token& peek_token(Lexer& lex);

/// Printable form of a token for error messages.
std::string describe(const Token& token);

} // namespace pdo::parser
