#include "Lexer.hpp"
#include "Errors.hpp"
#include <cctype>
#include <fmt/format.h>

namespace pdo::parser
{

[[noreturn]] void
parse_error(const Lexer& lex, int err_line, const std::string& msg)
{
    throw ParseError(fmt::format("{}:{}: {}", lex.filename, err_line, msg));
}

static bool ends_word(unsigned char c)
{
    return c == '(' || c == ')' || c == ';' || std::isspace(c);
}

// Advance past blanks and comments, counting lines.
static void skip_layout(Lexer& lex)
{
    bool in_comment = false;
    for (; lex.pos < lex.src.size(); ++lex.pos)
    {
        const unsigned char c = lex.src[lex.pos];
        if (c == '\n')
        {
            ++lex.line;
            in_comment = false;
        }
        else if (c == ';')
            in_comment = true;
        else if (!in_comment && !std::isspace(c))
            return;
    }
}

static Token scan(Lexer& lex)
{
    skip_layout(lex);
    Token token;
    token.line = lex.line;
    if (lex.pos == lex.src.size())
        return token;

    switch (lex.src[lex.pos])
    {
    case '(':
        ++lex.pos;
        token.kind = TokenKind::Open;
        return token;
    case ')':
        ++lex.pos;
        token.kind = TokenKind::Close;
        return token;
    default:
        break;
    }

    const size_t start = lex.pos;
    for (; lex.pos < lex.src.size(); ++lex.pos)
    {
        const unsigned char c = lex.src[lex.pos];
        if (ends_word(c))
            break;
        if (std::iscntrl(c))
            parse_error(lex,
                        lex.line,
                        fmt::format("unexpected control character 0x{:02x}", c));
    }
    token.kind = TokenKind::Word;
    token.text = std::string(lex.src.substr(start, lex.pos - start));
    return token;
}

Token next_token(Lexer& lex)
{
    if (lex.lookahead)
    {
        Token token = std::move(*lex.lookahead);
        lex.lookahead.reset();
        return token;
    }
    return scan(lex);
}

const Token& peek_token(Lexer& lex)
{
    if (!lex.lookahead)
        lex.lookahead = scan(lex);
    return *lex.lookahead;
}

std::string describe(const Token& token)
{
    switch (token.kind)
    {
    case TokenKind::Open:
        return "'('";
    case TokenKind::Close:
        return "')'";
    case TokenKind::Word:
        return "'" + token.text + "'";
    case TokenKind::End:
        break;
    }
    return "end of file";
}

} // namespace pdo::parser
