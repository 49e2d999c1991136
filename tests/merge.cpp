#include "merge.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "test-helpers.hpp"

using namespace fuse;
using namespace fuse::tests;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

// NOLINTBEGIN(readability-function-cognitive-complexity)

TEST_CASE("output path", "[merge]") {
    REQUIRE(default_output_path("/work/app/main.py") ==
            std::filesystem::path{"/work/app/main_merged.py"});
    REQUIRE(default_output_path("tool.py") ==
            std::filesystem::path{"tool_merged.py"});
}

TEST_CASE("single helper", "[merge]") {
    TempProject tp;
    tp.write("util.py", "def double(x):\n    return x * 2\n");
    tp.write("main.py", "from util import double\n\nprint(double(2))\n");

    auto result = tp.merge("main.py");
    REQUIRE(result.output == tp.path("main_merged.py"));
    REQUIRE(result.source == "# Generated by pyfuse from main.py. Do not edit.\n"
                             "\n"
                             "\n"
                             "# From util.py\n"
                             "def double(x):\n"
                             "    return x * 2\n"
                             "\n"
                             "\n"
                             "# Main script code\n"
                             "print(double(2))\n");

    REQUIRE(result.report.has_value());
    REQUIRE(result.verified());
}

TEST_CASE("colliding names are qualified", "[merge]") {
    TempProject tp;
    tp.write("pkg/__init__.py", "");
    tp.write("pkg/alpha.py", "def sameName():\n    return \"alpha\"\n");
    tp.write("pkg/beta.py", "def sameName():\n    return \"beta\"\n");
    tp.write("main.py",
             "from pkg.alpha import sameName\n"
             "from pkg.beta import sameName as other_same\n"
             "\n"
             "\n"
             "def main():\n"
             "    print(sameName(), other_same())\n"
             "\n"
             "\n"
             "if __name__ == \"__main__\":\n"
             "    main()\n");

    auto result = tp.merge("main.py");
    auto const& src = result.source;

    REQUIRE_THAT(src, ContainsSubstring("def pkg_alpha_sameName():"));
    REQUIRE_THAT(src, ContainsSubstring("def pkg_beta_sameName():"));
    REQUIRE(count(src, "def sameName(") == 0);
    REQUIRE_THAT(src, ContainsSubstring(
                          "print(pkg_alpha_sameName(), pkg_beta_sameName())"));
    REQUIRE_THAT(src, ContainsSubstring("# From pkg/alpha.py"));
    REQUIRE(count(src, "import") == 0);
    REQUIRE(appears_before(src, "def main():", "if __name__ == \"__main__\":"));
    REQUIRE(result.verified());
}

TEST_CASE("definitions do not shadow builtins in use", "[merge]") {
    TempProject tp;
    tp.write("fmtlib.py", "def format(x):\n    return \"<\" + str(x) + \">\"\n");
    tp.write("main.py",
             "from fmtlib import format as wrap\n"
             "\n"
             "print(wrap(1))\n"
             "print(format(2, \"03\"))\n");

    auto result = tp.merge("main.py");
    auto const& src = result.source;

    REQUIRE_THAT(src, ContainsSubstring("def fmtlib_format(x):"));
    REQUIRE(count(src, "def format(") == 0);
    REQUIRE_THAT(src, ContainsSubstring("print(fmtlib_format(1))"));
    REQUIRE_THAT(src, ContainsSubstring("print(format(2, \"03\"))"));
    REQUIRE(result.verified());

    SECTION("unused builtins leave the name alone") {
        tp.write("main.py", "from fmtlib import format\n\nprint(format(1))\n");

        auto plain = tp.merge("main.py");
        REQUIRE_THAT(plain.source, ContainsSubstring("def format(x):"));
        REQUIRE_THAT(plain.source, ContainsSubstring("print(format(1))"));
    }
}

TEST_CASE("class hierarchies are ordered", "[merge]") {
    TempProject tp;
    tp.write("base.py",
             "class Base:\n"
             "    def describe(self):\n"
             "        return \"base\"\n");
    tp.write("formatter.py",
             "from base import Base\n"
             "\n"
             "\n"
             "class Formatter(Base):\n"
             "    def format(self, v):\n"
             "        return str(v)\n");
    tp.write("validator.py",
             "from formatter import Formatter\n"
             "\n"
             "\n"
             "class Validator(Formatter):\n"
             "    def check(self, v):\n"
             "        return v is not None\n");
    tp.write("processor.py",
             "from validator import Validator\n"
             "\n"
             "\n"
             "class Processor(Validator):\n"
             "    pass\n");
    tp.write("main.py",
             "from processor import Processor\n"
             "\n"
             "if __name__ == \"__main__\":\n"
             "    p = Processor()\n"
             "    print(p.check(p.format(1)), p.describe())\n");

    auto result = tp.merge("main.py");
    auto const& src = result.source;

    REQUIRE(appears_before(src, "class Base:", "class Formatter(Base):"));
    REQUIRE(appears_before(src, "class Formatter(Base):",
                           "class Validator(Formatter):"));
    REQUIRE(appears_before(src, "class Validator(Formatter):",
                           "class Processor(Validator):"));
    REQUIRE(appears_before(src, "class Processor(Validator):",
                           "p = Processor()"));
    REQUIRE(count(src, "class ") == 4);
    REQUIRE(result.verified());
}

TEST_CASE("module initialization", "[merge]") {
    TempProject tp;
    tp.write("config.py",
             "import os\n"
             "\n"
             "DEBUG = os.environ.get(\"DEBUG\") == \"1\"\n"
             "handlers = []\n"
             "\n"
             "\n"
             "def register(fn):\n"
             "    handlers.append(fn)\n"
             "    return fn\n");
    tp.write("main.py",
             "import config\n"
             "\n"
             "\n"
             "@config.register\n"
             "def hello():\n"
             "    print(\"hello\", config.DEBUG)\n"
             "\n"
             "\n"
             "if __name__ == \"__main__\":\n"
             "    hello()\n");

    auto result = tp.merge("main.py");
    auto const& src = result.source;

    REQUIRE_THAT(src, ContainsSubstring("\nimport os\n"));
    REQUIRE(count(src, "import config") == 0);
    REQUIRE_THAT(src, ContainsSubstring("@register\ndef hello():"));
    REQUIRE_THAT(src, ContainsSubstring("print(\"hello\", DEBUG)"));
    REQUIRE_THAT(src, ContainsSubstring("# Module initialization statements\n"
                                        "\n"
                                        "# From config.py\n"
                                        "DEBUG = os.environ.get"));
    REQUIRE(appears_before(src, "handlers = []", "def register(fn):"));
    REQUIRE(appears_before(src, "def register(fn):", "def hello():"));
    REQUIRE(result.verified());
}

TEST_CASE("default arguments see module mutations", "[merge]") {
    TempProject tp;
    tp.write("reg.py",
             "items = []\n"
             "items.append(\"x\")\n"
             "\n"
             "\n"
             "def count(n=len(items)):\n"
             "    return n\n");
    tp.write("main.py", "from reg import count\n\nprint(count())\n");

    auto result = tp.merge("main.py");
    REQUIRE(appears_before(result.source, "items.append(\"x\")",
                           "def count(n=len(items)):"));
    REQUIRE(result.verified());
}

TEST_CASE("docstring and future imports lead", "[merge]") {
    TempProject tp;
    tp.write("shapes.py",
             "from __future__ import annotations\n"
             "\n"
             "import math\n"
             "\n"
             "\n"
             "def area(r: float) -> float:\n"
             "    return math.pi * r * r\n");
    tp.write("main.py",
             "\"\"\"Print the area of a circle.\"\"\"\n"
             "from __future__ import annotations\n"
             "\n"
             "from shapes import area\n"
             "\n"
             "print(area(1.0))\n");

    auto result = tp.merge("main.py");
    REQUIRE_THAT(result.source,
                 StartsWith("# Generated by pyfuse from main.py. Do not edit.\n"
                            "\n"
                            "\"\"\"Print the area of a circle.\"\"\"\n"
                            "\n"
                            "from __future__ import annotations\n"
                            "\n"
                            "import math\n"));
    REQUIRE(count(result.source, "from __future__") == 1);
    REQUIRE(result.verified());
}

TEST_CASE("verification can be skipped", "[merge]") {
    TempProject tp;
    tp.write("main.py", "print(1)\n");

    auto result = tp.merge("main.py", {.verify = false});
    REQUIRE_FALSE(result.report.has_value());
    REQUIRE(result.verified());
}

TEST_CASE("merge errors", "[merge]") {
    TempProject tp;

    SECTION("parse errors") {
        tp.write("main.py", "import broken\n");
        tp.write("broken.py", "def f(:\n    pass\n");
        REQUIRE_THROWS_AS((void)tp.merge("main.py"), ParseError);
    }

    SECTION("cycles") {
        tp.write("main.py",
                 "def ping():\n"
                 "    return pong()\n"
                 "\n"
                 "\n"
                 "def pong():\n"
                 "    return ping()\n"
                 "\n"
                 "\n"
                 "ping()\n");
        REQUIRE_THROWS_WITH((void)tp.merge("main.py"),
                            ContainsSubstring("main.ping") &&
                                ContainsSubstring("main.pong"));
    }

    SECTION("missing entry") {
        REQUIRE_THROWS_AS((void)tp.merge("nope.py"), std::runtime_error);
    }
}

// NOLINTEND(readability-function-cognitive-complexity)
