#include "SExpr.hpp"
#include <vector>

namespace pdo::parser
{

bool tagged(const SExpr& e, const std::string& tag)
{
    return !e.is_atom && !e.children.empty() && e.children[0].is_atom &&
           e.children[0].atom == tag;
}

std::string to_text(const SExpr& e)
{
    if (e.is_atom)
        return e.atom;
    std::string s = "(";
    for (size_t i = 0; i < e.children.size(); ++i)
    {
        if (i > 0)
            s += " ";
        s += to_text(e.children[i]);
    }
    return s + ")";
}

const std::string&
expect_atom(const SExpr& e, const Lexer& lex, const std::string& what)
{
    if (!e.is_atom)
        parse_error(lex, e.line, "expected " + what + ", got " + to_text(e));
    return e.atom;
}

SExpr parse_sexpr(Lexer& lex)
{
    // Lists still open, innermost last
    std::vector<SExpr> open;
    while (true)
    {
        Token tok = next_token(lex);
        SExpr done;
        switch (tok.kind)
        {
        case TokenKind::End:
            if (open.empty())
                parse_error(lex, tok.line, "unexpected end of file");
            parse_error(lex, open.back().line, "unclosed '('");
        case TokenKind::Open:
            open.push_back(SExpr{ false, {}, {}, tok.line });
            continue;
        case TokenKind::Close:
            if (open.empty())
                parse_error(lex, tok.line, "unexpected ')'");
            done = std::move(open.back());
            open.pop_back();
            break;
        case TokenKind::Word:
            done = SExpr{ true, std::move(tok.text), {}, tok.line };
            break;
        }

        if (open.empty())
            return done;
        open.back().children.push_back(std::move(done));
    }
}

SExpr parse_document(Lexer& lex)
{
    SExpr root = parse_sexpr(lex);
    const Token& trailing = peek_token(lex);
    if (trailing.kind != TokenKind::End)
        parse_error(lex,
                    trailing.line,
                    "unexpected " + describe(trailing) + " after the definition");
    return root;
}

} // namespace pdo::parser
