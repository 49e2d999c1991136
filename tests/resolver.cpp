#include "resolver.hpp"

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "catalog.hpp"
#include "test-helpers.hpp"

using namespace fuse;
using namespace fuse::tests;
using ast::NodeId;

// NOLINTBEGIN(readability-function-cognitive-complexity)

namespace {

struct Resolved : Parsed {
    explicit Resolved(std::string_view source) : Parsed{source} {
        (void)catalog.add_module(root, fileid, true);
        resolver.resolve();
        resolver.validate_attributes();
    }

    // every `Name` node spelled `name`, in source order
    [[nodiscard]] auto names(std::string_view name) const
        -> std::vector<NodeId> {
        std::vector<NodeId> out;
        for (auto id : catalog.get_module(0).names)
            if (ast.get(id).str == name) out.push_back(id);
        return out;
    }

    [[nodiscard]] auto unresolved_names() const -> std::vector<std::string> {
        std::vector<std::string> out;
        for (auto const& u : resolver.get_unresolved())
            out.emplace_back(u.name);
        std::ranges::sort(out);
        return out;
    }

    Catalog  catalog{ast};
    Resolver resolver{ast, catalog};
};

}  // namespace

TEST_CASE("names", "[resolver]") {
    Resolved r{"import os\n"
               "\n"
               "LIMIT = 3\n"
               "\n"
               "\n"
               "def scale(x):\n"
               "    return x * LIMIT + missing\n"
               "\n"
               "\n"
               "print(scale(2), len(os.sep))\n"};

    SECTION("uses resolve to their module symbol") {
        auto limit = r.catalog.get_scope(r.catalog.get_module(0).scope)
                         .find("LIMIT");
        auto uses = r.names("LIMIT");
        REQUIRE_FALSE(uses.empty());
        for (auto use : uses) REQUIRE(r.resolver.symbol_of(use) == limit);
    }

    SECTION("parameters shadow") {
        auto uses = r.names("x");
        REQUIRE_FALSE(uses.empty());

        auto sym = r.resolver.symbol_of(uses.back());
        REQUIRE(sym.is_valid());
        REQUIRE(r.catalog.get_symbol(sym).kind == SymbolKind::Parameter);
    }

    SECTION("builtins are not symbols") {
        auto print = r.names("print");
        REQUIRE(print.size() == 1);
        REQUIRE(r.resolver.symbol_of(print[0]).is_invalid());
    }

    SECTION("unknown names are reported") {
        REQUIRE(r.unresolved_names() == std::vector<std::string>{"missing"});
    }
}

TEST_CASE("class bodies are not visible from methods", "[resolver]") {
    Resolved r{"class K:\n"
               "    v = 1\n"
               "    w = v + 1\n"
               "\n"
               "    def m(self):\n"
               "        return v\n"};

    REQUIRE(r.unresolved_names() == std::vector<std::string>{"v"});
}

TEST_CASE("nested functions see enclosing functions", "[resolver]") {
    Resolved r{"def outer():\n"
               "    count = 0\n"
               "\n"
               "    def inner():\n"
               "        nonlocal count\n"
               "        count += 1\n"
               "        return count\n"
               "\n"
               "    return inner\n"};

    REQUIRE(r.resolver.get_unresolved().empty());
}

TEST_CASE("attributes of local classes", "[resolver]") {
    Resolved r{"class Box:\n"
               "    size = 1\n"
               "    label: str\n"
               "\n"
               "    def grow(self):\n"
               "        self.extra = 2\n"
               "        return self.size + self.extra\n"
               "\n"
               "\n"
               "class Crate(Box):\n"
               "    pass\n"
               "\n"
               "\n"
               "Box.patched = True\n"
               "b = Box()\n"
               "print(Box.size, b.extra, b.label, Box.patched, Crate.size)\n"
               "print(b.nothing, Crate.missing, b.__class__)\n"};

    REQUIRE(r.unresolved_names() ==
            std::vector<std::string>{"missing", "nothing"});

    SECTION("the class of an instance") {
        auto b = r.names("b");
        REQUIRE_FALSE(b.empty());
        REQUIRE(r.resolver.class_of(b.back()).is_valid());

        auto print = r.names("print");
        REQUIRE(r.resolver.class_of(print[0]).is_invalid());
    }
}

TEST_CASE("classes that accept any attribute", "[resolver]") {
    SECTION("__getattr__") {
        Resolved r{"class Proxy:\n"
                   "    def __getattr__(self, name):\n"
                   "        return name\n"
                   "\n"
                   "\n"
                   "p = Proxy()\n"
                   "print(p.anything)\n"};
        REQUIRE(r.resolver.get_unresolved().empty());
    }

    SECTION("unknown bases") {
        Resolved r{"from base import Base\n"
                   "\n"
                   "\n"
                   "class Child(Base):\n"
                   "    pass\n"
                   "\n"
                   "\n"
                   "print(Child.inherited)\n"};
        REQUIRE(r.resolver.get_unresolved().empty());
    }

    SECTION("decorated classes") {
        Resolved r{"def register(cls):\n"
                   "    return cls\n"
                   "\n"
                   "\n"
                   "@register\n"
                   "class Plugin:\n"
                   "    pass\n"
                   "\n"
                   "\n"
                   "print(Plugin.name)\n"};
        REQUIRE(r.resolver.get_unresolved().empty());
    }
}

// NOLINTEND(readability-function-cognitive-complexity)
