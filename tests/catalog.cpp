#include "catalog.hpp"

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <string_view>
#include <vector>

#include "test-helpers.hpp"

using namespace fuse;
using namespace fuse::tests;
using ast::NodeId;

// NOLINTBEGIN(readability-function-cognitive-complexity)

namespace {

struct Cataloged : Parsed {
    explicit Cataloged(std::string_view source) : Parsed{source} {
        (void)catalog.add_module(root, fileid, true);
    }

    [[nodiscard]] auto table() const -> ModuleTable const& {
        return catalog.get_module(0);
    }

    [[nodiscard]] auto find(std::string_view name) const -> SymbolId {
        return catalog.get_scope(table().scope).find(name);
    }

    [[nodiscard]] auto unit_at(size_t idx) const -> Unit const& {
        return catalog.get_unit(table().units.at(idx));
    }

    [[nodiscard]] auto has_ref(std::vector<NodeId> const& refs,
                               std::string_view name) const -> bool {
        return std::ranges::any_of(
            refs, [&](NodeId id) { return ast.get(id).str == name; });
    }

    Catalog catalog{ast};
};

}  // namespace

TEST_CASE("units", "[catalog]") {
    Cataloged c{"\"\"\"Module docstring.\"\"\"\n"
                "import os\n"
                "from typing import List\n"
                "\n"
                "LIMIT = 10\n"
                "cache = {}\n"
                "registry = make_registry()\n"
                "\n"
                "try:\n"
                "    import ujson as json\n"
                "except ImportError:\n"
                "    import json\n"
                "\n"
                "\n"
                "def helper(x):\n"
                "    return x * LIMIT\n"
                "\n"
                "\n"
                "class Shape:\n"
                "    def area(self):\n"
                "        return 0\n"
                "\n"
                "\n"
                "print(helper(2))\n"
                "\n"
                "if __name__ == \"__main__\":\n"
                "    main()\n"};

    std::vector<UnitKind> kinds;
    for (auto u : c.table().units) kinds.push_back(c.catalog.get_unit(u).kind);

    REQUIRE(kinds == std::vector{UnitKind::Docstring, UnitKind::Import,
                                 UnitKind::Import, UnitKind::Definition,
                                 UnitKind::Definition, UnitKind::Statement,
                                 UnitKind::GuardedImport, UnitKind::Definition,
                                 UnitKind::Definition, UnitKind::Statement,
                                 UnitKind::EntryBlock});

    SECTION("definitions know what they define") {
        auto const& helper = c.unit_at(7);
        REQUIRE(helper.defines.size() == 1);
        REQUIRE(c.catalog.get_symbol(helper.defines[0]).name == "helper");
        REQUIRE(c.catalog.get_symbol(helper.defines[0]).kind ==
                SymbolKind::Function);
    }

    SECTION("function bodies are lazy") {
        auto const& helper = c.unit_at(7);
        REQUIRE(c.has_ref(helper.lazy_refs, "LIMIT"));
        REQUIRE_FALSE(c.has_ref(helper.eager_refs, "LIMIT"));
    }

    SECTION("statements are eager") {
        auto const& stmt = c.unit_at(9);
        REQUIRE(c.has_ref(stmt.eager_refs, "helper"));
    }

    SECTION("methods belong to their class") {
        auto shape = c.table().units.at(8);
        auto const& unit = c.catalog.get_unit(shape);
        REQUIRE(unit.methods.size() == 1);

        auto const& method = c.catalog.get_unit(unit.methods[0]);
        REQUIRE(method.kind == UnitKind::Method);
        REQUIRE(method.owner == shape);
    }

    SECTION("guarded imports bind once") {
        auto json = c.find("json");
        REQUIRE(json.is_valid());
        REQUIRE(c.catalog.get_symbol(json).bindings.size() == 2);
        REQUIRE(c.catalog.get_duplicates().empty());
    }

    SECTION("imports") {
        REQUIRE(c.table().imports.size() == 4);
        REQUIRE(c.catalog.get_symbol(c.find("os")).kind == SymbolKind::Import);
        REQUIRE(c.catalog.get_symbol(c.find("List")).kind ==
                SymbolKind::Import);
    }
}

TEST_CASE("definitions that call are statements", "[catalog]") {
    Cataloged c{"a = 1\n"
                "b = [a, 2]\n"
                "c = len(b)\n"
                "d = lambda: len(b)\n"
                "a = 3\n"};

    REQUIRE(c.unit_at(0).kind == UnitKind::Definition);
    REQUIRE(c.unit_at(1).kind == UnitKind::Definition);
    REQUIRE(c.unit_at(2).kind == UnitKind::Statement);
    REQUIRE(c.unit_at(3).kind == UnitKind::Definition);
    REQUIRE(c.unit_at(4).kind == UnitKind::Statement);
}

TEST_CASE("string annotations are weak", "[catalog]") {
    Cataloged c{"def link(a: \"Node\") -> None:\n"
                "    pass\n"
                "\n"
                "\n"
                "class Node:\n"
                "    pass\n"};

    auto const& link = c.unit_at(0);
    REQUIRE(c.has_ref(link.weak_refs, "Node"));
    REQUIRE_FALSE(c.has_ref(link.eager_refs, "Node"));
}

TEST_CASE("duplicates", "[catalog]") {
    SECTION("functions") {
        Cataloged c{"def f():\n    pass\n\n\ndef f():\n    pass\n"};

        auto dups = c.catalog.get_duplicates();
        REQUIRE(dups.size() == 1);
        REQUIRE(c.catalog.get_symbol(dups[0].symbol).name == "f");
        REQUIRE(dups[0].first != dups[0].second);
    }

    SECTION("class and function") {
        Cataloged c{"class A:\n    pass\n\n\ndef A():\n    pass\n"};
        REQUIRE(c.catalog.get_duplicates().size() == 1);
    }

    SECTION("variables can be rebound") {
        Cataloged c{"x = 1\nx = 2\nx += 1\n"};
        REQUIRE(c.catalog.get_duplicates().empty());
    }

    SECTION("alternatives of an if") {
        Cataloged c{"if flag:\n"
                    "    def g():\n"
                    "        return 1\n"
                    "else:\n"
                    "    def g():\n"
                    "        return 2\n"};
        REQUIRE(c.catalog.get_duplicates().empty());
    }

    SECTION("property accessors") {
        Cataloged c{"class C:\n"
                    "    @property\n"
                    "    def v(self):\n"
                    "        return 1\n"
                    "\n"
                    "    @v.setter\n"
                    "    def v(self, value):\n"
                    "        pass\n"};
        REQUIRE(c.catalog.get_duplicates().empty());
    }

    SECTION("overloads") {
        Cataloged c{"from typing import overload\n"
                    "\n"
                    "@overload\n"
                    "def h(a: int) -> int:\n"
                    "    ...\n"
                    "@overload\n"
                    "def h(a: str) -> str:\n"
                    "    ...\n"
                    "def h(a):\n"
                    "    return a\n"};
        REQUIRE(c.catalog.get_duplicates().empty());
    }

    SECTION("the same module imported twice") {
        Cataloged c{"import os\nimport os.path\n"};
        REQUIRE(c.catalog.get_duplicates().empty());
    }

    SECTION("different imports of the same name") {
        Cataloged c{"from a import x\nfrom b import x\n"};
        REQUIRE(c.catalog.get_duplicates().size() == 1);
    }
}

TEST_CASE("scopes", "[catalog]") {
    Cataloged c{"data = [1, 2]\n"
                "squares = [y * y for y in data]\n"
                "\n"
                "\n"
                "class Counter:\n"
                "    def __init__(self):\n"
                "        self.count = 0\n"
                "\n"
                "\n"
                "def setup():\n"
                "    global CONFIG\n"
                "    CONFIG = 1\n"};

    SECTION("the first iterable of a comprehension is in the enclosing scope") {
        auto comp = c.ast.child(c.stmt(1), 1);
        auto gen = c.ast.child(comp, 1);
        auto data = c.ast.child(gen, 1);
        auto y = c.ast.child(gen, 0);

        REQUIRE(c.catalog.scope_of(data) == c.table().scope);
        REQUIRE(c.catalog.get_scope(c.catalog.scope_of(y)).kind ==
                ScopeKind::Comprehension);
        REQUIRE(c.find("y").is_invalid());
    }

    SECTION("attributes assigned through self") {
        auto cls = c.catalog.class_scope_of(c.find("Counter"));
        REQUIRE(cls.is_valid());
        REQUIRE(c.catalog.get_scope(cls).instance_attrs.contains("count"));
    }

    SECTION("global declarations bind at the module") {
        auto config = c.find("CONFIG");
        REQUIRE(config.is_valid());
        REQUIRE(c.catalog.get_symbol(config).scope == c.table().scope);
    }

    SECTION("binding nodes") {
        auto target = c.ast.child(c.stmt(0), 0);
        REQUIRE(c.catalog.symbol_bound_by(target) == c.find("data"));
        REQUIRE(c.catalog.unit_of(target) == c.table().units.at(0));
    }
}

TEST_CASE("entry blocks", "[catalog]") {
    Cataloged c{"if __name__ == '__main__':\n    pass\n"
                "if '__main__' == __name__:\n    pass\n"
                "if __name__ != '__main__':\n    pass\n"};

    REQUIRE(is_entry_block(c.ast, c.stmt(0)));
    REQUIRE(is_entry_block(c.ast, c.stmt(1)));
    REQUIRE_FALSE(is_entry_block(c.ast, c.stmt(2)));
}

// NOLINTEND(readability-function-cognitive-complexity)
