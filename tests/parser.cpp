#include "parser.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <fmt/format.h>

#include <nlohmann/json.hpp>
#include <vector>

#include "errors.hpp"
#include "test-helpers.hpp"

using namespace fuse;
using namespace fuse::tests;
using ast::NodeKind;

using Catch::Matchers::ContainsSubstring;

// NOLINTBEGIN(readability-function-cognitive-complexity)

TEST_CASE("empty module", "[parser]") {
    Parsed p{""};
    REQUIRE(p.ast.kind_of(p.root) == NodeKind::Module);
    REQUIRE(p.ast.children(p.root).empty());
}

TEST_CASE("function definition", "[parser]") {
    Parsed p{"@cache\ndef add(a, b=1, *args, c, **kw) -> int:\n"
             "    return a + b\n"};

    auto def = p.stmt(0);
    auto const& node = p.ast.get(def);
    REQUIRE(node.kind == NodeKind::FunctionDef);
    REQUIRE(node.str == "add");

    SECTION("the span starts at the decorator and ends at the body") {
        REQUIRE(p.text(def).starts_with("@cache"));
        REQUIRE(p.text(def).ends_with("return a + b"));
    }

    SECTION("children") {
        auto name = p.ast.child(def, 0);
        REQUIRE(p.ast.kind_of(name) == NodeKind::Name);
        REQUIRE(p.ast.get(name).is_store());
        REQUIRE(p.text(name) == "add");

        auto decorators = p.ast.child(def, 1);
        REQUIRE(p.ast.children(decorators).size() == 1);

        auto params = p.ast.children(p.ast.child(def, 2));
        REQUIRE(params.size() == 5);
        REQUIRE(p.ast.get(params[0]).str == "a");
        REQUIRE(p.ast.get(params[2]).get_param_kind() ==
                ast::ParamKind::VarArgs);
        REQUIRE(p.ast.get(params[3]).get_param_kind() ==
                ast::ParamKind::KwOnly);
        REQUIRE(p.ast.get(params[4]).get_param_kind() == ast::ParamKind::VarKw);

        REQUIRE(p.ast.child(def, 3).is_valid());
        REQUIRE(p.ast.kind_of(p.ast.child(def, 4)) == NodeKind::Block);
    }
}

TEST_CASE("class definition", "[parser]") {
    Parsed p{"class Point(Base, metaclass=Meta):\n"
             "    x: int = 0\n\n"
             "    def norm(self):\n"
             "        return self.x\n"};

    auto cls = p.stmt(0);
    REQUIRE(p.ast.kind_of(cls) == NodeKind::ClassDef);
    REQUIRE(p.ast.get(cls).str == "Point");

    auto args = p.ast.children(p.ast.child(cls, 2));
    REQUIRE(args.size() == 2);
    REQUIRE(p.ast.kind_of(args[1]) == NodeKind::Keyword);

    auto body = p.ast.children(p.ast.child(cls, 3));
    REQUIRE(body.size() == 2);
    REQUIRE(p.ast.kind_of(body[0]) == NodeKind::AnnAssign);
    REQUIRE(p.ast.kind_of(body[1]) == NodeKind::FunctionDef);
}

TEST_CASE("imports", "[parser]") {
    Parsed p{"import os.path as osp, sys\n"
             "from ..pkg import (a, b as c,)\n"
             "from . import sibling\n"
             "from mod import *\n"};

    SECTION("import") {
        auto stmt = p.stmt(0);
        REQUIRE(p.ast.kind_of(stmt) == NodeKind::Import);

        auto aliases = p.ast.children(stmt);
        REQUIRE(aliases.size() == 2);
        REQUIRE(p.ast.get(aliases[0]).str == "os.path");
        REQUIRE(p.ast.get(p.ast.child(aliases[0], 0)).str == "osp");
        REQUIRE(p.ast.child(aliases[1], 0).is_invalid());
    }

    SECTION("relative from-import") {
        auto const& node = p.ast.get(p.stmt(1));
        REQUIRE(node.kind == NodeKind::ImportFrom);
        REQUIRE(node.str == "pkg");
        REQUIRE(node.get_level() == 2);
        REQUIRE(p.ast.children(p.stmt(1)).size() == 2);

        auto const& bare = p.ast.get(p.stmt(2));
        REQUIRE(bare.str.empty());
        REQUIRE(bare.get_level() == 1);
    }

    SECTION("wildcard") {
        auto aliases = p.ast.children(p.stmt(3));
        REQUIRE(aliases.size() == 1);
        REQUIRE(p.ast.get(aliases[0]).str == "*");
    }
}

TEST_CASE("statements", "[parser]") {
    Parsed p{"a = b = 1\n"
             "x += 1; del y\n"
             "if a: pass\n"
             "elif b:\n"
             "    pass\n"
             "else:\n"
             "    pass\n"
             "for i, j in items:\n"
             "    continue\n"
             "while True:\n"
             "    break\n"
             "try:\n"
             "    pass\n"
             "except ValueError as e:\n"
             "    raise\n"
             "finally:\n"
             "    pass\n"
             "with open(p) as f, lock:\n"
             "    pass\n"};

    auto kinds = std::vector<NodeKind>{};
    for (auto stmt : p.ast.children(p.root)) kinds.push_back(p.ast.kind_of(stmt));

    REQUIRE(kinds == std::vector{NodeKind::Assign, NodeKind::AugAssign,
                                 NodeKind::Delete, NodeKind::If, NodeKind::For,
                                 NodeKind::While, NodeKind::Try,
                                 NodeKind::With});

    SECTION("chained assignment") {
        REQUIRE(p.ast.children(p.stmt(0)).size() == 3);
    }

    SECTION("elif is a nested if") {
        auto orelse = p.ast.child(p.stmt(3), 2);
        REQUIRE(p.ast.kind_of(orelse) == NodeKind::If);
    }

    SECTION("tuple targets are stores") {
        auto target = p.ast.child(p.stmt(4), 0);
        REQUIRE(p.ast.kind_of(target) == NodeKind::Tuple);
        for (auto elt : p.ast.children(target))
            REQUIRE(p.ast.get(elt).is_store());
    }
}

TEST_CASE("expressions", "[parser]") {
    Parsed p{"r = [f(x) for x in xs if x] + {k: v for k, v in d.items()}\n"
             "g = lambda a, *, b=2: a if b else None\n"
             "h = (n := 10) and not m or o[1:2, ::3]\n"};

    REQUIRE(p.ast.children(p.root).size() == 3);

    auto value = p.ast.child(p.stmt(0), 1);
    REQUIRE(p.ast.kind_of(value) == NodeKind::BinOp);
    REQUIRE(p.ast.kind_of(p.ast.child(value, 0)) == NodeKind::ListComp);
    REQUIRE(p.ast.kind_of(p.ast.child(value, 1)) == NodeKind::DictComp);

    REQUIRE(p.ast.kind_of(p.ast.child(p.stmt(1), 1)) == NodeKind::Lambda);
    REQUIRE(p.ast.kind_of(p.ast.child(p.stmt(2), 1)) == NodeKind::BoolOp);
}

TEST_CASE("strings", "[parser]") {
    Parsed p{"s = f\"{name!r:>{width}} {{literal}}\"\n"
             "t = 'a' \"b\"\n"
             "u = b'raw'\n"};

    SECTION("f-string fields are parsed") {
        auto str = p.ast.child(p.stmt(0), 1);
        auto const& node = p.ast.get(str);
        REQUIRE(node.kind == NodeKind::Str);
        REQUIRE((node.flags & ast::STR_FSTRING) != 0);

        auto fields = p.ast.children(str);
        REQUIRE(fields.size() == 2);
        REQUIRE(p.ast.get(fields[0]).str == "name");
        REQUIRE(p.ast.get(fields[1]).str == "width");
    }

    SECTION("implicit concatenation") {
        auto const& node = p.ast.get(p.ast.child(p.stmt(1), 1));
        REQUIRE((node.flags & ast::STR_CONCAT) != 0);
        REQUIRE(node.str == "'a' \"b\"");
    }

    SECTION("bytes") {
        auto const& node = p.ast.get(p.ast.child(p.stmt(2), 1));
        REQUIRE((node.flags & ast::STR_BYTES) != 0);
    }
}

TEST_CASE("string annotations", "[parser]") {
    Parsed p{"def f(a: \"Node\") -> \"List[int]\":\n"
             "    pass\n"
             "x: \"not valid (\" = 1\n"};

    auto params = p.ast.children(p.ast.child(p.stmt(0), 2));
    auto ann = p.ast.child(params[0], 0);
    REQUIRE(p.ast.kind_of(ann) == NodeKind::ForwardRef);
    REQUIRE(p.ast.get(p.ast.child(ann, 0)).str == "Node");

    auto returns = p.ast.child(p.stmt(0), 3);
    REQUIRE(p.ast.kind_of(returns) == NodeKind::ForwardRef);
    REQUIRE(p.ast.kind_of(p.ast.child(returns, 0)) == NodeKind::Subscript);

    SECTION("strings that do not parse stay strings") {
        auto ann = p.ast.child(p.stmt(1), 1);
        REQUIRE(p.ast.kind_of(ann) == NodeKind::Str);
    }
}

TEST_CASE("soft keywords", "[parser]") {
    Parsed p{"match = 1\nmatch.x = 2\ntype = str\nprint(match)\n"};
    REQUIRE(p.ast.children(p.root).size() == 4);
}

TEST_CASE("syntax errors", "[parser]") {
    FileStore fs;
    auto      parse = [&](std::string_view source) {
        ast::Ast ast;
        auto     id = fs.add_file_and_contents(
            fmt::format(":memory:{}", fs.size()), source);
        (void)parse_source(source, id, ast);
    };

    REQUIRE_THROWS_AS(parse("def f(:\n    pass\n"), ParseError);
    REQUIRE_THROWS_AS(parse("if x\n    pass\n"), ParseError);
    REQUIRE_THROWS_AS(parse("  x = 1\n"), ParseError);
    REQUIRE_THROWS_AS(parse("def f():\nreturn 1\n"), ParseError);

    SECTION("match statements") {
        REQUIRE_THROWS_WITH(parse("match command:\n    case 1:\n        pass\n"),
                            ContainsSubstring("match statements"));
    }

    SECTION("the error points at the file") {
        try {
            parse("x = (1 +\n");
            FAIL("expected a parse error");
        } catch (ParseError const& e) {
            REQUIRE(e.get_kind() == FindingKind::ParseFailure);
            REQUIRE(e.get_locations().size() == 1);
        }
    }
}

TEST_CASE("string literal body", "[ast]") {
    REQUIRE(ast::string_literal_body("'abc'") == "abc");
    REQUIRE(ast::string_literal_body("rb\"x\"") == "x");
    REQUIRE(ast::string_literal_body("\"\"\"doc\"\"\"") == "doc");
    REQUIRE(ast::string_literal_body("''").empty());
}

TEST_CASE("dump", "[ast]") {
    Parsed p{"x = 1\n"};
    auto   j = ast::dump_node(p.ast, p.root);
    REQUIRE(j.is_object());
    REQUIRE(ast::dump_node(p.ast, ast::NodeId::invalid()).is_null());
}

// NOLINTEND(readability-function-cognitive-complexity)
