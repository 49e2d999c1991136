#include "tokenizer.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "errors.hpp"

using namespace fuse;

using Catch::Matchers::ContainsSubstring;

// NOLINTBEGIN(readability-function-cognitive-complexity)

namespace {

auto types_of(std::string_view source) -> std::vector<TokenType> {
    std::vector<TokenType> types;
    for (auto const& t : tokenize(source, FileId::from_raw_data(0)))
        types.push_back(t.type);

    return types;
}

auto texts_of(std::string_view source) -> std::vector<std::string> {
    std::vector<std::string> texts;
    for (auto const& t : tokenize(source, FileId::from_raw_data(0))) {
        if (t.is_eof() || t.is(TokenType::Newline)) continue;
        texts.emplace_back(t.span.str(source));
    }

    return texts;
}

}  // namespace

TEST_CASE("empty source", "[tokenizer]") {
    REQUIRE(types_of("") == std::vector{TokenType::Eof});
    REQUIRE(types_of("\n\n   \n# only a comment\n") ==
            std::vector{TokenType::Eof});
}

TEST_CASE("simple assignment", "[tokenizer]") {
    REQUIRE(types_of("x = 1\n") ==
            std::vector{TokenType::Id, TokenType::Equal, TokenType::Number,
                        TokenType::Newline, TokenType::Eof});

    SECTION("a newline is added at the end of the input") {
        REQUIRE(types_of("x = 1") == types_of("x = 1\n"));
    }
}

TEST_CASE("indentation", "[tokenizer]") {
    auto types = types_of("if x:\n    y\nz\n");
    REQUIRE(types ==
            std::vector{TokenType::Id, TokenType::Id, TokenType::Colon,
                        TokenType::Newline, TokenType::Indent, TokenType::Id,
                        TokenType::Newline, TokenType::Dedent, TokenType::Id,
                        TokenType::Newline, TokenType::Eof});

    SECTION("blocks still open at the end are closed") {
        auto types = types_of("def f():\n    if x:\n        pass");
        REQUIRE(types.size() >= 3);
        REQUIRE(types[types.size() - 1] == TokenType::Eof);
        REQUIRE(types[types.size() - 2] == TokenType::Dedent);
        REQUIRE(types[types.size() - 3] == TokenType::Dedent);
    }

    SECTION("inconsistent dedent") {
        REQUIRE_THROWS_AS(types_of("if x:\n    y\n  z\n"), ParseError);
    }
}

TEST_CASE("implicit line joining", "[tokenizer]") {
    auto types = types_of("f(a,\n  b)\n");
    REQUIRE(types == std::vector{TokenType::Id, TokenType::Lparen,
                                 TokenType::Id, TokenType::Comma,
                                 TokenType::Id, TokenType::Rparen,
                                 TokenType::Newline, TokenType::Eof});

    SECTION("backslash continuation") {
        REQUIRE(types_of("x = 1 + \\\n    2\n") ==
                std::vector{TokenType::Id, TokenType::Equal, TokenType::Number,
                            TokenType::Plus, TokenType::Number,
                            TokenType::Newline, TokenType::Eof});
    }
}

TEST_CASE("operators", "[tokenizer]") {
    REQUIRE(types_of("a ** b // c -> d := e") ==
            std::vector{TokenType::Id, TokenType::StarStar, TokenType::Id,
                        TokenType::SlashSlash, TokenType::Id, TokenType::Arrow,
                        TokenType::Id, TokenType::ColonEqual, TokenType::Id,
                        TokenType::Newline, TokenType::Eof});

    SECTION("augmented assignment keeps the operator in the text") {
        REQUIRE(texts_of("a **= 2; b >>= 1") ==
                std::vector<std::string>{"a", "**=", "2", ";", "b", ">>=",
                                         "1"});
    }
}

TEST_CASE("strings", "[tokenizer]") {
    REQUIRE(texts_of(R"(x = "a" 'b' rb"c" f"{d}")") ==
            std::vector<std::string>{"x", "=", R"("a")", "'b'", R"(rb"c")",
                                     R"(f"{d}")"});

    SECTION("triple quoted strings span lines") {
        auto texts = texts_of("s = \"\"\"one\ntwo\"\"\"\n");
        REQUIRE(texts.size() == 3);
        REQUIRE(texts[2] == "\"\"\"one\ntwo\"\"\"");
    }

    SECTION("escaped quotes") {
        REQUIRE(texts_of(R"("a \" b")") ==
                std::vector<std::string>{R"("a \" b")"});
    }

    SECTION("unterminated") {
        REQUIRE_THROWS_WITH(types_of("s = 'abc\n"),
                            ContainsSubstring("unterminated string"));
    }
}

TEST_CASE("numbers", "[tokenizer]") {
    REQUIRE(texts_of("1 1_000 0xFF 1.5 .5 1e-3 2j") ==
            std::vector<std::string>{"1", "1_000", "0xFF", "1.5", ".5", "1e-3",
                                     "2j"});
}

TEST_CASE("brackets", "[tokenizer]") {
    SECTION("never closed") {
        REQUIRE_THROWS_WITH(types_of("f(a, b\n"),
                            ContainsSubstring("'(' was never closed"));
    }

    SECTION("mismatched") {
        REQUIRE_THROWS_WITH(types_of("f(a]\n"),
                            ContainsSubstring("does not match"));
    }

    SECTION("unmatched") {
        REQUIRE_THROWS_WITH(types_of("a)\n"), ContainsSubstring("unmatched"));
    }
}

TEST_CASE("expression mode ignores line breaks", "[tokenizer]") {
    std::string_view source = "x: \"List[\n int]\"";
    auto             tokens =
        tokenize_expression(source, {.begin = 4, .end = 15},
                            FileId::from_raw_data(0));

    std::vector<std::string_view> texts;
    for (auto const& t : tokens) texts.push_back(t.span.str(source));

    REQUIRE(texts == std::vector<std::string_view>{"List", "[", "int", "]", ""});
}

TEST_CASE("reserved words", "[tokenizer]") {
    REQUIRE(is_reserved("def"));
    REQUIRE(is_reserved("lambda"));
    REQUIRE_FALSE(is_reserved("match"));
    REQUIRE_FALSE(is_reserved("print"));
}

TEST_CASE("tokens as json", "[tokenizer]") {
    nlohmann::json j = tokenize("x\n", FileId::from_raw_data(0));
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 3);
}

// NOLINTEND(readability-function-cognitive-complexity)
