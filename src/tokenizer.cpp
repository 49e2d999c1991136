#include "tokenizer.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "errors.hpp"

using json = nlohmann::json;

namespace fuse {

[[nodiscard]] constexpr auto is_digit(uint8_t c) -> bool {
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr auto is_alpha(uint8_t c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// non-ascii bytes are accepted as part of identifiers, they are utf-8
[[nodiscard]] constexpr auto is_id_start(uint8_t c) -> bool {
    return is_alpha(c) || c == '_' || c >= 0x80;
}

[[nodiscard]] constexpr auto is_id_char(uint8_t c) -> bool {
    return is_id_start(c) || is_digit(c);
}

[[nodiscard]] constexpr auto is_string_prefix(std::string_view s) -> bool {
    if (s.empty() || s.size() > 2) return false;

    std::array<char, 2> p{};
    for (size_t i = 0; i < s.size(); i++) {
        auto c = s[i];
        p[i] = static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
    }

    if (s.size() == 1) {
        return p[0] == 'r' || p[0] == 'u' || p[0] == 'b' || p[0] == 'f';
    }

    auto a = p[0];
    auto b = p[1];
    return (a == 'r' && (b == 'b' || b == 'f')) ||
           ((a == 'b' || a == 'f') && b == 'r');
}

auto is_reserved(std::string_view s) -> bool {
    static constexpr std::array<std::string_view, 35> keywords{
        "False",  "None",     "True",    "and",    "as",       "assert",
        "async",  "await",    "break",   "class",  "continue", "def",
        "del",    "elif",     "else",    "except", "finally",  "for",
        "from",   "global",   "if",      "import", "in",       "is",
        "lambda", "nonlocal", "not",     "or",     "pass",     "raise",
        "return", "try",      "while",   "with",   "yield",
    };

    return std::ranges::find(keywords, s) != keywords.end();
}

struct Tokenizer {
    [[nodiscard]] constexpr auto is_at_end() const -> bool {
        return current >= end;
    }

    constexpr void advance() {
        if (!is_at_end()) current++;
    }

    [[nodiscard]] constexpr auto peek_at(uint32_t n) const -> uint8_t {
        if (current + n >= end) return 0;
        return source[current + n];
    }

    [[nodiscard]] constexpr auto peek() const -> uint8_t { return peek_at(0); }

    [[nodiscard]] constexpr auto peek_next() const -> uint8_t {
        return peek_at(1);
    }

    constexpr auto peek_and_advance() -> uint8_t {
        auto c = peek();
        advance();
        return c;
    }

    constexpr auto match(uint8_t c) -> bool {
        if (peek() == c) {
            advance();
            return true;
        }

        return false;
    }

    [[nodiscard]] constexpr auto span() const -> Span {
        return {.begin = start, .end = current};
    }

    [[nodiscard]] constexpr auto mkt(TokenType t) const -> Token {
        return {.type = t, .span = span()};
    }

    [[noreturn]] void error(Span s, std::string message) const {
        throw ParseError{std::move(message), {.fileid = fileid, .span = s}};
    }

    // ------------------------------------------------------------------------

    auto tokenize_all() -> std::vector<Token> {
        while (true) {
            if (at_line_start && !expression_mode &&
                balancing_stack.empty()) {
                if (!handle_indentation()) break;
            }

            skip_whitespace();

            start = current;
            if (is_at_end()) break;

            if (peek() == '\n') {
                advance();
                if (expression_mode || !balancing_stack.empty()) continue;

                tokens.push_back(mkt(TokenType::Newline));
                at_line_start = true;
                continue;
            }

            auto t = tokenize_one();
            if (t.is_open()) {
                balancing_stack.push_back(t);
            } else if (t.is_close()) {
                close_bracket(t);
            }

            tokens.push_back(t);
        }

        if (!balancing_stack.empty()) {
            auto top = balancing_stack.back();
            error(top.span,
                  fmt::format("'{}' was never closed", top.span.str(source)));
        }

        start = current;
        if (!expression_mode) {
            if (!tokens.empty() && !tokens.back().is(TokenType::Newline) &&
                !tokens.back().is(TokenType::Dedent)) {
                tokens.push_back(mkt(TokenType::Newline));
            }

            while (indents.size() > 1) {
                indents.pop_back();
                tokens.push_back(mkt(TokenType::Dedent));
            }
        }

        tokens.push_back(mkt(TokenType::Eof));
        return tokens;
    }

    void close_bracket(Token const& t) {
        if (balancing_stack.empty()) {
            error(t.span, fmt::format("unmatched '{}'", t.span.str(source)));
        }

        auto top = balancing_stack.back();
        auto expected = top.is(TokenType::Lparen)     ? TokenType::Rparen
                        : top.is(TokenType::Lbracket) ? TokenType::Rbracket
                                                      : TokenType::Rbrace;
        if (t.type != expected) {
            error(t.span,
                  fmt::format("closing '{}' does not match opening '{}'",
                              t.span.str(source), top.span.str(source)));
        }

        balancing_stack.pop_back();
    }

    // Measure the indentation of the next logical line and emit the indent
    // and dedent tokens for it. Blank and comment-only lines are skipped.
    // Returns false when the end of input was reached instead.
    auto handle_indentation() -> bool {
        while (true) {
            uint32_t col = 0;
            while (!is_at_end()) {
                auto c = peek();
                if (c == ' ') {
                    col++;
                } else if (c == '\t') {
                    col = (col / 8 + 1) * 8;
                } else if (c == '\f') {
                    col = 0;
                } else {
                    break;
                }

                advance();
            }

            if (peek() == '#') {
                while (!is_at_end() && peek() != '\n') advance();
            }

            if (peek() == '\r') advance();
            if (is_at_end()) return false;
            if (match('\n')) continue;

            start = current;
            at_line_start = false;

            if (col > indents.back()) {
                indents.push_back(col);
                tokens.push_back(mkt(TokenType::Indent));
                return true;
            }

            while (col < indents.back()) {
                indents.pop_back();
                tokens.push_back(mkt(TokenType::Dedent));
            }

            if (col != indents.back()) {
                error(span(),
                      "unindent does not match any outer indentation level");
            }

            return true;
        }
    }

    constexpr void skip_whitespace() {
        while (!is_at_end()) {
            auto c = peek();
            if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
                advance();
            } else if (c == '#') {
                while (!is_at_end() && peek() != '\n') advance();
            } else if (c == '\\' && (peek_next() == '\n' ||
                                     (peek_next() == '\r' && peek_at(2) == '\n'))) {
                advance();
                if (peek() == '\r') advance();
                advance();
            } else {
                break;
            }
        }
    }

    // NOLINTNEXTLINE(readability-function-cognitive-complexity)
    auto tokenize_one() -> Token {
        auto c = peek_and_advance();
        switch (c) {
            case '=':
                if (match('=')) return mkt(TokenType::EqualEqual);
                return mkt(TokenType::Equal);
            case '!':
                if (match('=')) return mkt(TokenType::BangEqual);
                error(span(), "invalid syntax '!'");
            case '<':
                if (match('=')) return mkt(TokenType::LessEqual);
                if (match('<')) {
                    if (match('=')) return mkt(TokenType::AugAssign);
                    return mkt(TokenType::LessLess);
                }
                return mkt(TokenType::Less);
            case '>':
                if (match('=')) return mkt(TokenType::GreaterEqual);
                if (match('>')) {
                    if (match('=')) return mkt(TokenType::AugAssign);
                    return mkt(TokenType::GreaterGreater);
                }
                return mkt(TokenType::Greater);
            case '+':
                if (match('=')) return mkt(TokenType::AugAssign);
                return mkt(TokenType::Plus);
            case '-':
                if (match('=')) return mkt(TokenType::AugAssign);
                if (match('>')) return mkt(TokenType::Arrow);
                return mkt(TokenType::Minus);
            case '*':
                if (match('*')) {
                    if (match('=')) return mkt(TokenType::AugAssign);
                    return mkt(TokenType::StarStar);
                }
                if (match('=')) return mkt(TokenType::AugAssign);
                return mkt(TokenType::Star);
            case '/':
                if (match('/')) {
                    if (match('=')) return mkt(TokenType::AugAssign);
                    return mkt(TokenType::SlashSlash);
                }
                if (match('=')) return mkt(TokenType::AugAssign);
                return mkt(TokenType::Slash);
            case '%':
                if (match('=')) return mkt(TokenType::AugAssign);
                return mkt(TokenType::Percent);
            case '@':
                if (match('=')) return mkt(TokenType::AugAssign);
                return mkt(TokenType::At);
            case '&':
                if (match('=')) return mkt(TokenType::AugAssign);
                return mkt(TokenType::Ampersand);
            case '|':
                if (match('=')) return mkt(TokenType::AugAssign);
                return mkt(TokenType::Pipe);
            case '^':
                if (match('=')) return mkt(TokenType::AugAssign);
                return mkt(TokenType::Carrot);
            case '~': return mkt(TokenType::Tilde);
            case ':':
                if (match('=')) return mkt(TokenType::ColonEqual);
                return mkt(TokenType::Colon);
            case ';': return mkt(TokenType::Semi);
            case ',': return mkt(TokenType::Comma);
            case '.':
                if (is_digit(peek())) return tokenize_number();
                if (peek() == '.' && peek_next() == '.') {
                    advance();
                    advance();
                    return mkt(TokenType::DotDotDot);
                }
                return mkt(TokenType::Dot);
            case '(': return mkt(TokenType::Lparen);
            case ')': return mkt(TokenType::Rparen);
            case '{': return mkt(TokenType::Lbrace);
            case '}': return mkt(TokenType::Rbrace);
            case '[': return mkt(TokenType::Lbracket);
            case ']': return mkt(TokenType::Rbracket);
            case '"':
            case '\'': return tokenize_string(c);
            default: break;
        }

        if (is_digit(c)) return tokenize_number();
        if (is_id_start(c)) return tokenize_id();

        error(span(), fmt::format("invalid character '{}' (0x{:02x})",
                                  static_cast<char>(c), c));
    }

    auto tokenize_id() -> Token {
        while (is_id_char(peek())) advance();

        if ((peek() == '"' || peek() == '\'') &&
            is_string_prefix(span().str(source))) {
            return tokenize_string(peek_and_advance());
        }

        return mkt(TokenType::Id);
    }

    constexpr auto tokenize_number() -> Token {
        auto first = source[start];
        auto radix = first == '0' && (peek() == 'x' || peek() == 'X' ||
                                      peek() == 'o' || peek() == 'O' ||
                                      peek() == 'b' || peek() == 'B');
        if (radix) advance();

        while (true) {
            auto c = peek();
            if (!radix && (c == 'e' || c == 'E') &&
                (peek_next() == '+' || peek_next() == '-')) {
                advance();
                advance();
            } else if (is_id_char(c) || (c == '.' && !radix)) {
                advance();
            } else {
                break;
            }
        }

        return mkt(TokenType::Number);
    }

    // the opening quote has already been consumed
    auto tokenize_string(uint8_t quote) -> Token {
        auto triple = false;
        if (peek() == quote && peek_next() == quote) {
            advance();
            advance();
            triple = true;
        }

        while (true) {
            if (is_at_end()) error(span(), "unterminated string literal");

            auto c = peek_and_advance();
            if (c == '\\') {
                if (peek() == '\r' && peek_next() == '\n') advance();
                advance();
                continue;
            }

            if (c == quote) {
                if (!triple) break;
                if (peek() == quote && peek_next() == quote) {
                    advance();
                    advance();
                    break;
                }

                continue;
            }

            if (c == '\n' && !triple) {
                error(span(), "unterminated string literal");
            }
        }

        return mkt(TokenType::Str);
    }

    std::string_view source;
    FileId           fileid;

    uint32_t start{};
    uint32_t current{};
    uint32_t end{};

    bool expression_mode{};
    bool at_line_start{true};

    std::vector<Token>    tokens;
    std::vector<Token>    balancing_stack;
    std::vector<uint32_t> indents{0};
};

auto tokenize(std::string_view source, FileId fileid) -> std::vector<Token> {
    auto t = Tokenizer{
        .source = source,
        .fileid = fileid,
        .start = 0,
        .current = 0,
        .end = static_cast<uint32_t>(source.size()),
    };

    return t.tokenize_all();
}

auto tokenize_expression(std::string_view source, Span range, FileId fileid)
    -> std::vector<Token> {
    auto t = Tokenizer{
        .source = source,
        .fileid = fileid,
        .start = range.begin,
        .current = range.begin,
        .end = range.end,
        .expression_mode = true,
    };

    return t.tokenize_all();
}

auto format_as(TokenType type) -> std::string_view {
    switch (type) {
        case TokenType::Equal: return "Equal";
        case TokenType::EqualEqual: return "EqualEqual";
        case TokenType::BangEqual: return "BangEqual";
        case TokenType::Less: return "Less";
        case TokenType::LessLess: return "LessLess";
        case TokenType::LessEqual: return "LessEqual";
        case TokenType::Greater: return "Greater";
        case TokenType::GreaterGreater: return "GreaterGreater";
        case TokenType::GreaterEqual: return "GreaterEqual";
        case TokenType::Plus: return "Plus";
        case TokenType::Minus: return "Minus";
        case TokenType::Star: return "Star";
        case TokenType::StarStar: return "StarStar";
        case TokenType::Slash: return "Slash";
        case TokenType::SlashSlash: return "SlashSlash";
        case TokenType::Percent: return "Percent";
        case TokenType::At: return "At";
        case TokenType::Ampersand: return "Ampersand";
        case TokenType::Pipe: return "Pipe";
        case TokenType::Carrot: return "Carrot";
        case TokenType::Tilde: return "Tilde";
        case TokenType::Arrow: return "Arrow";
        case TokenType::ColonEqual: return "ColonEqual";
        case TokenType::AugAssign: return "AugAssign";
        case TokenType::Colon: return "Colon";
        case TokenType::Semi: return "Semi";
        case TokenType::Comma: return "Comma";
        case TokenType::Dot: return "Dot";
        case TokenType::DotDotDot: return "DotDotDot";
        case TokenType::Lparen: return "Lparen";
        case TokenType::Rparen: return "Rparen";
        case TokenType::Lbrace: return "Lbrace";
        case TokenType::Rbrace: return "Rbrace";
        case TokenType::Lbracket: return "Lbracket";
        case TokenType::Rbracket: return "Rbracket";
        case TokenType::Id: return "Id";
        case TokenType::Number: return "Number";
        case TokenType::Str: return "Str";
        case TokenType::Newline: return "Newline";
        case TokenType::Indent: return "Indent";
        case TokenType::Dedent: return "Dedent";
        case TokenType::Eof: return "Eof";
    }

    return "?";
}

void to_json(json& j, TokenType const& n) { j = format_as(n); }

void to_json(json& j, Token const& t) {
    j = json{
        {"type", t.type},
        {"span", t.span},
    };
}

}  // namespace fuse

auto fmt::formatter<fuse::TokenType>::format(fuse::TokenType const& p,
                                             format_context&        ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(fuse::format_as(p), ctx);
}

auto fmt::formatter<fuse::Token>::format(fuse::Token const& p,
                                         format_context&    ctx) const
    -> format_context::iterator {
    return fmt::format_to(ctx.out(), "{}({})", p.type, p.span);
}
