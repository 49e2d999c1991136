#include "argparser.hpp"

#include <fmt/format.h>

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "merge.hpp"

using namespace pyfuse;

// NOLINTBEGIN(readability-function-cognitive-complexity)

namespace {

auto parse(std::vector<std::string> words) -> Args {
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    argv.push_back(nullptr);

    return argparse(static_cast<int>(words.size()), argv.data());
}

}  // namespace

TEST_CASE("step flags", "[argparser]") {
    static_assert(fuse::VerboseStep{}.with_exe().with_order().has_order());
    static_assert(!fuse::VerboseStep{}.with_load().has_graph());
    static_assert(fuse::DumpStep{}.with_ast().has(fuse::DumpStep::Ast));

    auto verbose = fuse::VerboseStep{}.with_load().with_exe();
    REQUIRE(fmt::format("{}", verbose) == "exe,load");

    auto dump = fuse::DumpStep{}.with_renames().with_tokens();
    REQUIRE(fmt::format("{}", dump) == "tokens,renames");
}

TEST_CASE("merge", "[argparser]") {
    auto args = parse({"pyfuse", "merge", "app/main.py", "app"});

    REQUIRE(args.command == Command::Merge);
    REQUIRE(args.program == "app/main.py");
    REQUIRE(args.root == "app");
    REQUIRE(args.merge.verify);
    REQUIRE(args.merge.output.empty());
    REQUIRE(args.merge.verbose.value == fuse::VerboseStep::None);
    REQUIRE(args.merge.dump.value == fuse::DumpStep::None);
    REQUIRE(args.error_format == fuse::ErrorReporterFormat::Pretty);

    SECTION("options") {
        auto args = parse({"pyfuse", "merge", "--no-verify", "--verbose",
                           "load,graph", "--verbose", "order", "--dump",
                           "renames", "-o", "out.py", "--error-format", "json",
                           "main.py", "."});

        REQUIRE_FALSE(args.merge.verify);
        REQUIRE(args.merge.output == "out.py");
        REQUIRE(args.merge.verbose.has_load());
        REQUIRE(args.merge.verbose.has_graph());
        REQUIRE(args.merge.verbose.has_order());
        REQUIRE_FALSE(args.merge.verbose.has_exe());
        REQUIRE(args.merge.dump.has_renames());
        REQUIRE_FALSE(args.merge.dump.has_ast());
        REQUIRE(args.error_format == fuse::ErrorReporterFormat::Json);
        REQUIRE(args.program == "main.py");
        REQUIRE(args.root == ".");
    }
}

TEST_CASE("audit", "[argparser]") {
    auto args = parse({"pyfuse", "audit", "--format", "json", "out.py"});

    REQUIRE(args.command == Command::Audit);
    REQUIRE(args.program == "out.py");
    REQUIRE(args.root.empty());
    REQUIRE(args.report_format == ReportFormat::Json);
    REQUIRE(fmt::format("{}", args.command) == "audit");
}

// NOLINTEND(readability-function-cognitive-complexity)
