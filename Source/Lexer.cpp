#include "PL/Lexer.hpp"
#include <tao/pegtl.hpp>

namespace pl::lex {

    namespace pegtl = tao::pegtl;

    static SourceLocation locFrom(const pegtl::position& p) {
        SourceLocation l; l.line = p.line; l.column = p.column; return l;
    }

    // Whitespace and comments (skipped)
    struct sp : pegtl::sor< pegtl::one<' '>, pegtl::one<'\t'>, pegtl::one<'\r'> > {};
    struct line_comment : pegtl::seq< pegtl::sor< pegtl::two<'/'>, pegtl::one<'#'> >, pegtl::until< pegtl::at< pegtl::eolf >, pegtl::any > > {};
    struct block_comment : pegtl::seq< pegtl::string<'/','*'>, pegtl::until< pegtl::string<'*','/'>, pegtl::any > > {};
    struct skipped : pegtl::sor< sp, line_comment, block_comment > {};

    // Newline token
    struct newline_tok : pegtl::one<'\n'> {};

    // Identifiers
    struct ident_start : pegtl::sor< pegtl::alpha, pegtl::one<'_'> > {};
    struct ident_rest  : pegtl::sor< pegtl::alnum, pegtl::one<'_'> > {};
    struct identifier  : pegtl::seq< ident_start, pegtl::star< ident_rest > > {};

    // Numbers: optional '-', digits, optional fraction or exponent
    struct digits : pegtl::plus< pegtl::digit > {};
    struct opt_sign : pegtl::opt< pegtl::one<'-'> > {};
    struct frac : pegtl::seq< pegtl::one<'.'>, digits > {};
    struct expn : pegtl::seq< pegtl::sor< pegtl::one<'e'>, pegtl::one<'E'> >, pegtl::opt< pegtl::one<'+','-'> >, digits > {};
    struct number : pegtl::seq< opt_sign, digits, pegtl::opt< frac >, pegtl::opt< expn > > {};

    // Strings: simple handling with escapes
    struct esc_seq : pegtl::seq< pegtl::one<'\\'>, pegtl::any > {};
    struct dquot_str_content : pegtl::until< pegtl::one<'"'>, pegtl::sor< esc_seq, pegtl::not_one<'"'> > > {};
    struct squot_str_content : pegtl::until< pegtl::one<'\''>, pegtl::sor< esc_seq, pegtl::not_one<'\''> > > {};
    struct dquoted_string : pegtl::seq< pegtl::one<'"'>, dquot_str_content > {};
    struct squoted_string : pegtl::seq< pegtl::one<'\''>, squot_str_content > {};
    struct string_lit : pegtl::sor< dquoted_string, squoted_string > {};

    // Single and multi-char tokens
    struct lparen : pegtl::one<'('> {};
    struct rparen : pegtl::one<')'> {};
    struct comma  : pegtl::one<','> {};
    struct colon  : pegtl::one<':'> {};
    struct dot    : pegtl::one<'.'> {};
    struct plus   : pegtl::one<'+'> {};
    struct minus  : pegtl::one<'-'> {};
    struct colondash : pegtl::string<':','-'> {};

    // Unknown single char fallback
    struct unknown_char : pegtl::not_one< '\0' > {};

    // Token union in priority order
    struct token_rule : pegtl::sor<
                newline_tok,
                skipped,
                string_lit,
                colondash,
                number,
                identifier,
                lparen, rparen, comma, colon, dot, plus, minus,
                unknown_char
            > {};

    struct tokens_grammar : pegtl::must< pegtl::star< token_rule >, pegtl::eof > {};

    // Actions
    template< typename Rule > struct action : pegtl::nothing< Rule > {};

    struct TokenSink {
        std::vector<Token> out;
    };

    static std::string unescape(const std::string& s) {
        if (s.empty()) return {};
        char quote = s.front();
        size_t i = 1;
        std::string res;
        while (i < s.size()) {
            char c = s[i++];
            if (c == quote) break;
            if (c == '\\' && i < s.size()) {
                switch (const char e = s[i++]) {
                    case 'n': res.push_back('\n'); break;
                    case 't': res.push_back('\t'); break;
                    case 'r': res.push_back('\r'); break;
                    case '\\': res.push_back('\\'); break;
                    case '"': res.push_back('"'); break;
                    case '\'': res.push_back('\''); break;
                    default: res.push_back(e); break;
                }
            } else {
                res.push_back(c);
            }
        }
        return res;
    }

    template<> struct action< newline_tok > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.type = Token::Newline; t.text = "\n"; t.loc = locFrom(in.position());
            sink.out.push_back(std::move(t));
        }
    };

    // identifier, or the `not` keyword
    template<> struct action< identifier > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.text = in.string(); t.loc = locFrom(in.position());
            t.type = t.text == "not" ? Token::KwNot : Token::Identifier;
            sink.out.push_back(std::move(t));
        }
    };

    template<> struct action< number > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.text = in.string(); t.loc = locFrom(in.position());
            if (t.text.find_first_of(".eE") != std::string::npos) t.type = Token::Float; else t.type = Token::Integer;
            sink.out.push_back(std::move(t));
        }
    };

    template<> struct action< string_lit > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.type = Token::String; t.text = unescape(in.string()); t.loc = locFrom(in.position());
            sink.out.push_back(std::move(t));
        }
    };

#define PL_DEFINE_TOKEN_ACTION(rule, tokentype) \
    template<> struct action< rule > { \
        template< typename Input > \
        static void apply(const Input& in, TokenSink& sink) { \
            Token t; t.type = tokentype; t.text = in.string(); t.loc = locFrom(in.position()); \
            sink.out.push_back(std::move(t)); \
        } \
    };

    PL_DEFINE_TOKEN_ACTION(lparen, Token::LParen)
    PL_DEFINE_TOKEN_ACTION(rparen, Token::RParen)
    PL_DEFINE_TOKEN_ACTION(comma,  Token::Comma)
    PL_DEFINE_TOKEN_ACTION(colon,  Token::Colon)
    PL_DEFINE_TOKEN_ACTION(dot,    Token::Dot)
    PL_DEFINE_TOKEN_ACTION(plus,   Token::Plus)
    PL_DEFINE_TOKEN_ACTION(minus,  Token::Minus)
    PL_DEFINE_TOKEN_ACTION(colondash, Token::ColonDash)
    PL_DEFINE_TOKEN_ACTION(unknown_char, Token::Unknown)

#undef PL_DEFINE_TOKEN_ACTION

    TokenStream::TokenStream(std::string_view src) {
        pegtl::memory_input in(src.data(), src.size(), "<input>");
        TokenSink sink;
        pegtl::parse< tokens_grammar, action >(in, sink);
        Token end; end.type = Token::End; end.text = ""; end.loc = {0,0};
        sink.out.push_back(std::move(end));
        tokens_ = std::move(sink.out);
    }

    const Token& TokenStream::peek() const { return tokens_[idx_]; }
    const Token& TokenStream::lookahead(size_t n) const {
        const size_t i = idx_ + n;
        return i < tokens_.size() ? tokens_[i] : tokens_.back();
    }
    Token TokenStream::consume() {
        if (idx_ + 1 >= tokens_.size()) return tokens_.back();
        return tokens_[idx_++];
    }

}
