#include "PL/Parser.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <tao/pegtl.hpp>
#include "PL/Lexer.hpp"

namespace pl {

namespace {

using pl::lex::Token;
using pl::lex::TokenStream;

TokenStream tokenize(const std::string_view src) {
    try {
        return TokenStream(src);
    } catch (const tao::pegtl::parse_error& e) {
        throw ParseError(std::string("Lexer error: ") + e.what());
    }
}

class Parser {
public:
    explicit Parser(const std::string_view src) : toks_(tokenize(src)) {
        advance();
    }

    std::vector<Formula> parseProgram() {
        std::vector<Formula> out;
        while (tok_.type != Token::End) {
            if (tok_.type == Token::Newline) { advance(); continue; }
            out.push_back(parseStatement());
            endStatement();
        }
        return out;
    }

    Formula parseSingle() {
        skipNewlines();
        if (tok_.type == Token::End) errorHere("rule or fact expected");
        Formula f = parseStatement();
        endStatement();
        skipNewlines();
        if (tok_.type != Token::End) errorHere("expected a single statement");
        return f;
    }

    Atom parseSingleAtom() {
        skipNewlines();
        Atom a = parseAtom();
        accept(Token::Dot);
        skipNewlines();
        if (tok_.type != Token::End) errorHere("expected a single atom");
        return a;
    }

private:
    TokenStream toks_;
    Token tok_;

    void advance() { tok_ = toks_.consume(); }
    void skipNewlines() { while (tok_.type == Token::Newline) advance(); }

    static bool startsWithUpper(const std::string& s) {
        if (s.empty()) return false;
        return std::isupper(static_cast<unsigned char>(s[0])) != 0;
    }

    [[noreturn]] void errorHere(const std::string& msg) const {
        std::ostringstream oss;
        oss << "Parse error at line " << tok_.loc.line << ", col " << tok_.loc.column << ": " << msg;
        if (!tok_.text.empty() && tok_.type != Token::Newline) oss << " (found '" << tok_.text << "')";
        throw ParseError(oss.str());
    }

    bool accept(Token::Type t) {
        if (tok_.type == t) { advance(); return true; }
        return false;
    }

    void expect(Token::Type t, const char* what) {
        if (!accept(t)) {
            errorHere(std::string("expected ") + what);
        }
    }

    // Optional '.', then a newline or end of input
    void endStatement() {
        accept(Token::Dot);
        if (tok_.type != Token::Newline && tok_.type != Token::End) {
            errorHere("expected end of statement");
        }
    }

    Term parseTerm() {
        switch (tok_.type) {
            case Token::Identifier: {
                std::string name = tok_.text;
                advance();
                if (startsWithUpper(name)) return Constant{std::move(name), Constant::Kind::Symbol};
                return Variable{std::move(name)};
            }
            case Token::Integer:
            case Token::Float: {
                Constant c{tok_.text, Constant::Kind::Number};
                advance();
                return c;
            }
            case Token::String: {
                Constant c{tok_.text, Constant::Kind::String};
                advance();
                return c;
            }
            default:
                errorHere("term (variable or constant) expected");
        }
    }

    // [theory ':'] table ['+'|'-'] ['(' terms ')']
    Atom parseAtom() {
        if (tok_.type != Token::Identifier) errorHere("table name expected");
        Atom a;
        a.loc = tok_.loc;
        std::string name = tok_.text;
        advance();
        if (tok_.type == Token::Colon) {
            advance();
            if (tok_.type != Token::Identifier) errorHere("table name expected after theory prefix");
            a.theory = std::move(name);
            name = tok_.text;
            advance();
        }
        // update tables, e.g. p+(x) or p-(x)
        if ((tok_.type == Token::Plus || tok_.type == Token::Minus) && toks_.peek().type == Token::LParen) {
            name += tok_.text;
            advance();
        }
        a.table = std::move(name);
        if (accept(Token::LParen)) {
            if (tok_.type != Token::RParen) {
                a.arguments.push_back(parseTerm());
                while (accept(Token::Comma)) a.arguments.push_back(parseTerm());
            }
            expect(Token::RParen, "')'");
        }
        return a;
    }

    Literal parseLiteral() {
        Literal lit;
        if (accept(Token::KwNot)) lit.negated = true;
        lit.atom = parseAtom();
        return lit;
    }

    Formula parseStatement() {
        Atom head = parseAtom();
        if (!accept(Token::ColonDash)) return head;
        skipNewlines();
        Rule r;
        r.loc = head.loc;
        r.head = std::move(head);
        r.body.push_back(parseLiteral());
        while (accept(Token::Comma)) {
            skipNewlines();
            r.body.push_back(parseLiteral());
        }
        return r;
    }
};

} // namespace

std::vector<Formula> parseProgram(std::string_view source) {
    Parser p(source);
    return p.parseProgram();
}

std::vector<Formula> parseFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ParseError("Failed to open file: " + path);
    std::ostringstream ss; ss << in.rdbuf();
    return parseProgram(ss.str());
}

Formula parseFormula(std::string_view source) {
    Parser p(source);
    return p.parseSingle();
}

Rule parseRule(std::string_view source) {
    return asRule(parseFormula(source));
}

Atom parseAtom(std::string_view source) {
    Parser p(source);
    return p.parseSingleAtom();
}

} // namespace pl
