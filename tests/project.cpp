#include "project.hpp"

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "depgraph.hpp"
#include "errors.hpp"
#include "name-order.hpp"
#include "rename.hpp"
#include "test-helpers.hpp"
#include "utils.hpp"

using namespace fuse;
using namespace fuse::tests;
using Catch::Matchers::ContainsSubstring;

// NOLINTBEGIN(readability-function-cognitive-complexity)

namespace {

struct Loaded {
    explicit Loaded(TempProject const& tp, std::string_view entry = "main.py")
        : project{fs, tp.root()} {
        project.load(tp.path(entry));
    }

    // the unit that defines `name` at the top-level of `module`
    [[nodiscard]] auto unit_of(std::string_view module,
                               std::string_view name) const -> UnitId {
        auto idx = project.find_module(module);
        if (!idx) return UnitId::invalid();

        auto const& catalog = project.get_catalog();
        auto        scope = catalog.get_module(*idx).scope;
        auto        sym = catalog.get_scope(scope).find(name);
        if (sym.is_invalid()) return UnitId::invalid();

        return catalog.get_symbol(sym).unit();
    }

    FileStore fs;
    Project   project;
};

}  // namespace

TEST_CASE("loading", "[project]") {
    TempProject tp;
    tp.write("pkg/__init__.py", "");
    tp.write("pkg/alpha.py", "def f():\n    return 1\n");
    tp.write("main.py",
             "import os\n"
             "from pkg.alpha import f\n"
             "\n"
             "print(f(), os.sep)\n");

    Loaded l{tp};
    auto const& project = l.project;

    REQUIRE(project.get_modules().size() == 3);
    REQUIRE(project.get_entry().name == "main");
    REQUIRE(project.get_entry().relpath == "main.py");
    REQUIRE(project.get_entry().is_entry);

    auto pkg = project.find_module("pkg");
    REQUIRE(pkg.has_value());
    REQUIRE(project.get_module(*pkg).is_package);
    REQUIRE(project.get_module(*pkg).relpath == "pkg/__init__.py");

    auto alpha = project.find_module("pkg.alpha");
    REQUIRE(alpha.has_value());
    REQUIRE_FALSE(project.get_module(*alpha).is_package);

    REQUIRE_FALSE(project.find_module("os").has_value());

    SECTION("modules finish loading after their imports") {
        auto order = project.get_load_order();
        REQUIRE(order.size() == 3);
        REQUIRE(order.back() == project.get_entry().index);
    }
}

TEST_CASE("missing relative imports", "[project]") {
    TempProject tp;
    tp.write("main.py", "from .nowhere import thing\n\nprint(thing)\n");

    Loaded l{tp};
    REQUIRE_THROWS_AS(l.project.link(), UnresolvedReferenceError);
}

TEST_CASE("link errors", "[project]") {
    TempProject tp;
    tp.write("util.py", "def helper():\n    return 1\n");

    SECTION("wildcard imports") {
        tp.write("main.py", "from util import *\n\nhelper()\n");

        Loaded l{tp};
        try {
            l.project.link();
            FAIL("expected an error");
        } catch (UnsupportedConstructError const& e) {
            REQUIRE(e.get_message() ==
                    "wildcard import from 'util' is not supported");
            REQUIRE(e.get_locations().size() == 1);
        }
    }

    SECTION("__import__") {
        tp.write("main.py", "mod = __import__(\"util\")\n");

        Loaded l{tp};
        REQUIRE_THROWS_WITH(l.project.link(),
                            ContainsSubstring("dynamic import with "
                                              "'__import__'"));
    }

    SECTION("importlib") {
        tp.write("main.py",
                 "import importlib\n\nmod = importlib.import_module(\"util\")\n");

        Loaded l{tp};
        REQUIRE_THROWS_WITH(
            l.project.link(),
            ContainsSubstring("dynamic import with 'importlib.import_module'"));
    }

    SECTION("duplicates") {
        tp.write("main.py", "def run():\n    pass\n\n\ndef run():\n    pass\n");

        Loaded l{tp};
        try {
            l.project.link();
            FAIL("expected an error");
        } catch (DuplicateDefinitionError const& e) {
            REQUIRE(e.get_message() ==
                    "'run' is defined more than once in the same scope");
            REQUIRE(e.get_locations().size() == 2);
        }
    }

    SECTION("unresolved names") {
        tp.write("main.py", "print(helper_that_does_not_exist)\n");

        Loaded l{tp};
        REQUIRE_THROWS_AS(l.project.link(), UnresolvedReferenceError);
        REQUIRE_THROWS_WITH(l.project.link(),
                            ContainsSubstring("'helper_that_does_not_exist'"));
    }

    SECTION("names a module does not have") {
        tp.write("main.py", "from util import missing\n\nmissing()\n");

        Loaded l{tp};
        REQUIRE_THROWS_WITH(
            l.project.link(),
            ContainsSubstring("module 'util' has no attribute 'missing'"));
    }

    SECTION("modules used as values") {
        tp.write("main.py", "import util\n\nprint(util)\n");

        Loaded l{tp};
        REQUIRE_THROWS_AS(l.project.link(), UnsupportedConstructError);
    }
}

TEST_CASE("references through modules", "[project]") {
    TempProject tp;
    tp.write("pkg/__init__.py", "");
    tp.write("pkg/alpha.py", "def f():\n    return 1\n");
    tp.write("main.py", "import pkg.alpha\n\nprint(pkg.alpha.f())\n");

    Loaded l{tp};
    l.project.link();

    auto const& ast = l.project.get_ast();
    auto const& table = l.project.get_catalog().get_module(
        l.project.get_entry().index);

    auto use = std::ranges::find_if(table.names, [&](ast::NodeId id) {
        return ast.get(id).str == "pkg" && !ast.get(id).is_store();
    });
    REQUIRE(use != table.names.end());

    auto target = l.project.ref_target(*use);
    auto const& sym = l.project.get_catalog().get_symbol(target.symbol);
    REQUIRE(sym.name == "f");
    REQUIRE(l.project.get_module(sym.module).name == "pkg.alpha");
    REQUIRE(ast.kind_of(target.node) == ast::NodeKind::Attribute);
}

TEST_CASE("dependency graph", "[project]") {
    TempProject tp;
    tp.write("lib.py",
             "SCALE = 2\n"
             "\n"
             "\n"
             "def used(x):\n"
             "    return inner(x) * SCALE\n"
             "\n"
             "\n"
             "def inner(x):\n"
             "    return x + 1\n"
             "\n"
             "\n"
             "def unused():\n"
             "    return 0\n"
             "\n"
             "\n"
             "print(\"lib loaded\")\n");
    tp.write("main.py",
             "from lib import used\n"
             "\n"
             "\n"
             "def main():\n"
             "    print(used(1))\n"
             "\n"
             "\n"
             "if __name__ == \"__main__\":\n"
             "    main()\n"
             "\n"
             "if __name__ == \"__main__\":\n"
             "    main()\n");

    Loaded l{tp};
    l.project.link();
    auto graph = build_dependency_graph(l.project);

    REQUIRE(graph.contains(l.unit_of("main", "main")));
    REQUIRE(graph.contains(l.unit_of("lib", "used")));
    REQUIRE(graph.contains(l.unit_of("lib", "inner")));
    REQUIRE(graph.contains(l.unit_of("lib", "SCALE")));
    REQUIRE_FALSE(graph.contains(l.unit_of("lib", "unused")));

    auto const& catalog = l.project.get_catalog();

    SECTION("imported modules run their statements") {
        auto lib = *l.project.find_module("lib");
        auto print = catalog.get_module(lib).units.back();
        REQUIRE(catalog.get_unit(print).kind == UnitKind::Statement);
        REQUIRE(graph.contains(print));
    }

    SECTION("only the first entry block") {
        auto units = catalog.get_module(l.project.get_entry().index).units;
        auto n = std::ranges::count_if(units, [&](UnitId u) {
            return graph.contains(u) &&
                   catalog.get_unit(u).kind == UnitKind::EntryBlock;
        });
        REQUIRE(n == 1);
    }

    SECTION("definitions come after what they use") {
        auto order = sort::order_units(l.project, graph);
        auto pos = [&](UnitId u) {
            return std::ranges::find(order, u) - order.begin();
        };

        REQUIRE(pos(l.unit_of("lib", "inner")) < pos(l.unit_of("lib", "used")));
        REQUIRE(pos(l.unit_of("lib", "SCALE")) < pos(l.unit_of("lib", "used")));
        REQUIRE(pos(l.unit_of("lib", "used")) < pos(l.unit_of("main", "main")));
    }
}

TEST_CASE("load trace", "[project]") {
    TempProject tp;
    tp.write("util.py", "def double(x):\n    return x * 2\n");
    tp.write("main.py", "from util import double\n\nprint(double(2))\n");

    MemStream ms;
    FileStore fs;
    Project   project{fs, tp.root(), ms.f};
    project.load(tp.path("main.py"));

    auto text = std::string{ms.flush_str()};
    REQUIRE_THAT(text, ContainsSubstring("(entry) [1 files, "));
    REQUIRE_THAT(text, ContainsSubstring("load: util from util.py [2 files, "));
}

TEST_CASE("definitions that read module state are demoted", "[project]") {
    TempProject tp;
    tp.write("main.py",
             "import sys\n"
             "\n"
             "MODE = str(sys.argv[0])\n"
             "\n"
             "\n"
             "class Config:\n"
             "    mode = MODE\n"
             "\n"
             "\n"
             "print(Config.mode)\n");

    Loaded l{tp};
    l.project.link();
    auto graph = build_dependency_graph(l.project);

    auto config = l.unit_of("main", "Config");
    REQUIRE(graph.contains(config));
    REQUIRE(graph.is_demoted(config));
    REQUIRE_FALSE(graph.is_ordered(l.project.get_catalog(), config));
}

TEST_CASE("definitions that read mutated state are demoted", "[project]") {
    TempProject tp;
    tp.write("reg.py",
             "items = []\n"
             "items.append(\"x\")\n"
             "\n"
             "\n"
             "def count(n=len(items)):\n"
             "    return n\n"
             "\n"
             "\n"
             "def first():\n"
             "    return items[0]\n");
    tp.write("main.py",
             "from reg import count, first\n"
             "\n"
             "print(count(), first())\n");

    Loaded l{tp};
    l.project.link();
    auto graph = build_dependency_graph(l.project);

    REQUIRE(graph.is_demoted(l.unit_of("reg", "count")));

    // only read when called
    auto first = l.unit_of("reg", "first");
    REQUIRE_FALSE(graph.is_demoted(first));
    REQUIRE(graph.is_ordered(l.project.get_catalog(), first));
}

TEST_CASE("renames", "[project]") {
    TempProject tp;
    tp.write("pkg/__init__.py", "");
    tp.write("pkg/alpha.py", "def sameName():\n    return 1\n");
    tp.write("pkg/beta.py", "def sameName():\n    return 2\n");
    tp.write("main.py",
             "from pkg.alpha import sameName\n"
             "from pkg.beta import sameName as other_same\n"
             "\n"
             "\n"
             "def unique():\n"
             "    return sameName() + other_same()\n"
             "\n"
             "\n"
             "print(unique())\n");

    Loaded l{tp};
    l.project.link();
    auto graph = build_dependency_graph(l.project);
    auto plan = resolve_conflicts(l.project, graph);

    REQUIRE(plan.renamed.size() == 2);

    std::vector<std::string> names;
    for (auto sym : plan.renamed)
        names.push_back(l.project.get_catalog().get_symbol(sym).qualified_name);
    std::ranges::sort(names);
    REQUIRE(names ==
            std::vector<std::string>{"pkg_alpha_sameName", "pkg_beta_sameName"});

    auto unique = l.unit_of("main", "unique");
    auto const& catalog = l.project.get_catalog();
    auto sym = catalog.get_unit(unique).defines.at(0);
    REQUIRE(catalog.get_symbol(sym).emitted_name() == "unique");

    SECTION("qualified names") {
        auto alpha = *l.project.find_module("pkg.alpha");
        REQUIRE(qualified_name_for(l.project.get_module(alpha), "x") ==
                "pkg_alpha_x");
    }
}

TEST_CASE("external import collisions", "[project]") {
    TempProject tp;
    tp.write("util.py",
             "from os import path\n"
             "\n"
             "\n"
             "def home():\n"
             "    return path.expanduser(\"~\")\n");
    tp.write("main.py",
             "import sys\n"
             "from util import home\n"
             "\n"
             "path = sys.argv[0]\n"
             "print(home(), path)\n");

    Loaded l{tp};
    l.project.link();
    auto graph = build_dependency_graph(l.project);
    auto plan = resolve_conflicts(l.project, graph);

    auto it = std::ranges::find_if(plan.imports, [](ExternalImport const& i) {
        return i.module == "os";
    });
    REQUIRE(it != plan.imports.end());
    REQUIRE(it->alias == "path_os");
    REQUIRE(it->render() == "from os import path as path_os");
}

TEST_CASE("cycles", "[project]") {
    TempProject tp;
    tp.write("main.py",
             "def ping(n):\n"
             "    return pong(n - 1) if n else 0\n"
             "\n"
             "\n"
             "def pong(n):\n"
             "    return ping(n - 1) if n else 1\n"
             "\n"
             "\n"
             "print(ping(3))\n");

    Loaded l{tp};
    l.project.link();
    auto graph = build_dependency_graph(l.project);

    try {
        (void)sort::order_units(l.project, graph);
        FAIL("expected a cycle");
    } catch (CircularDependencyError const& e) {
        std::vector<std::string> symbols{e.get_symbols().begin(),
                                         e.get_symbols().end()};
        std::ranges::sort(symbols);
        REQUIRE(symbols == std::vector<std::string>{"main.ping", "main.pong"});
        REQUIRE_THAT(e.get_message(),
                     ContainsSubstring("circular dependency detected"));
    }
}

// NOLINTEND(readability-function-cognitive-complexity)
