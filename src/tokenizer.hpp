#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string_view>
#include <vector>

#include "file-store.hpp"
#include "location.hpp"
#include "macros.hpp"

namespace fuse {

enum class TokenType : uint8_t {
    Equal,
    EqualEqual,
    BangEqual,
    Less,
    LessLess,
    LessEqual,
    Greater,
    GreaterGreater,
    GreaterEqual,
    Plus,
    Minus,
    Star,
    StarStar,
    Slash,
    SlashSlash,
    Percent,
    At,
    Ampersand,
    Pipe,
    Carrot,
    Tilde,
    Arrow,
    ColonEqual,
    // any of `+=`, `-=`, `**=`, ... the operator is in the token text
    AugAssign,
    Colon,
    Semi,
    Comma,
    Dot,
    DotDotDot,
    Lparen,
    Rparen,
    Lbrace,
    Rbrace,
    Lbracket,
    Rbracket,
    // identifiers and keywords
    Id,
    Number,
    // string literal including its prefix and quotes
    Str,
    Newline,
    Indent,
    Dedent,
    Eof,
};

struct Token {
    TokenType type;
    Span      span;

    [[nodiscard]] constexpr auto is(TokenType t) const -> bool {
        return type == t;
    }

    [[nodiscard]] constexpr auto is_eof() const -> bool {
        return type == TokenType::Eof;
    }

    [[nodiscard]] constexpr auto is_id() const -> bool {
        return type == TokenType::Id;
    }

    [[nodiscard]] constexpr auto is_kw(std::string_view src,
                                       std::string_view kw) const -> bool {
        return is_id() && span.str(src) == kw;
    }

    [[nodiscard]] constexpr auto is_open() const -> bool {
        return type == TokenType::Lparen || type == TokenType::Lbracket ||
               type == TokenType::Lbrace;
    }

    [[nodiscard]] constexpr auto is_close() const -> bool {
        return type == TokenType::Rparen || type == TokenType::Rbracket ||
               type == TokenType::Rbrace;
    }

    constexpr auto operator==(Token const& o) const -> bool = default;
};

/// Is `s` one of the reserved words of the language. Soft keywords (`match`,
/// `case`, `type`, `_`) are not reserved.
[[nodiscard]] auto is_reserved(std::string_view s) -> bool;

/// Tokenize a whole file. Throws `ParseError` on malformed input.
auto tokenize(std::string_view source, FileId fileid) -> std::vector<Token>;

/// Tokenize `range` of `source` as a free standing expression: line breaks are
/// ignored and no indentation tokens are generated. Spans still point into
/// `source`. Used for f-string fields and string annotations.
auto tokenize_expression(std::string_view source, Span range, FileId fileid)
    -> std::vector<Token>;

auto format_as(TokenType type) -> std::string_view;

void to_json(nlohmann::json& j, TokenType const& n);
void to_json(nlohmann::json& j, Token const& t);

}  // namespace fuse

define_formatter_from_string_view(fuse::TokenType);
define_formatter_from_string_view(fuse::Token);
