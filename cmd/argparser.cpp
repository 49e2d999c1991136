#include "argparser.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <ranges>
#include <string_view>

#include "error-reporter.hpp"
#include "fuse.hpp"
#include "utils.hpp"

namespace rv = std::ranges::views;

namespace pyfuse {

void print_usage(std::string_view self) {
    fmt::print(stderr, "usage: {} merge [options] <entry.py> <project-root>\n",
               self);
    fmt::print(stderr, "       {} audit [options] <file.py>\n", self);
}

void print_version() { fmt::print(stderr, "pyfuse: {}\n", fuse::get_version()); }

void print_help(std::string_view self) {
    print_usage(self);

    // clang-format off
    fmt::print(stderr, "\n");
    fmt::print(stderr, "commands:\n");
    fmt::print(stderr, "    merge: merge the entry script and the project modules it needs into a\n");
    fmt::print(stderr, "        single file, written beside the entry script as <entry>_merged.py.\n");
    fmt::print(stderr, "    audit: check that a single file has no duplicate top-level definitions\n");
    fmt::print(stderr, "        and no unresolved references. Exits with 1 when it does.\n");
    fmt::print(stderr, "\n");
    fmt::print(stderr, "options:\n");
    fmt::print(stderr, "    -h,--help: show this message and exit.\n");
    fmt::print(stderr, "    --usage: show usage and exit.\n");
    fmt::print(stderr, "    --version: print the version.\n");
    fmt::print(stderr, "    --verify: audit the merged file (default). Exits with 2 when it fails.\n");
    fmt::print(stderr, "    --no-verify: do not audit the merged file.\n");
    fmt::print(stderr, "    -o,--output <path>: where to write the merged file.\n");
    fmt::print(stderr, "    --verbose <steps>: show more output (on stderr) for each step. This option\n");
    fmt::print(stderr, "        accepts a list of steps separated by commas: step1,step2. This option can\n");
    fmt::print(stderr, "        also be passed multiple times: --verbose step1 --verbose step2\n");
    fmt::print(stderr, "        available steps:\n");
    fmt::print(stderr, "            exe: make the tool plumbing itself more verbose.\n");
    fmt::print(stderr, "            load: show every module as it is loaded.\n");
    fmt::print(stderr, "            graph: show what the dependency graph selected.\n");
    fmt::print(stderr, "            order: show the order of the merged definitions.\n");
    fmt::print(stderr, "    --dump <steps>: dump the result of an internal step (on stderr). This option\n");
    fmt::print(stderr, "        accepts a list of steps separated by a comma: step1,step2. The option\n");
    fmt::print(stderr, "        can also be passed multiple times: --dump step1 --dump step2\n");
    fmt::print(stderr, "        available steps:\n");
    fmt::print(stderr, "            tokens: dump the tokens of the entry script.\n");
    fmt::print(stderr, "            ast: dump the parsed AST of the entry script.\n");
    fmt::print(stderr, "            graph: dump the dependency graph as a mermaid diagram.\n");
    fmt::print(stderr, "            renames: dump every name changed by the conflict resolver.\n");
    fmt::print(stderr, "            order: dump the order of the merged definitions.\n");
    fmt::print(stderr, "    --format <format>: how `audit` prints its report.\n");
    fmt::print(stderr, "        available formats:\n");
    fmt::print(stderr, "            text: every finding with its source lines, as --error-format says (default).\n");
    fmt::print(stderr, "            json: the structured report.\n");
    fmt::print(stderr, "    --error-format <format>: Change how errors are formatted.\n");
    fmt::print(stderr, "        available formats:\n");
    fmt::print(stderr, "            pretty: show the error message and context information in a readable way (default).\n");
    fmt::print(stderr, "            json: all data in the report is given in a json format.\n");
    // clang-format on
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
auto argparse(int argc, char** argv) -> Args {
    auto it = fuse::ArgIterator{.argc = argc, .argv = argv};

    std::string_view self;
    if (!it.next(self)) {
        fmt::print(stderr, "error: no argv[0]\n");
        std::exit(1);
    }

    Args args;

    std::string_view arg;
    auto             has_command = false;
    auto             has_output = false;
    while (it.next(arg)) {
        if (arg == "-h" || arg == "--help") {
            print_help(self);
            std::exit(0);
        }

        if (arg == "--usage") {
            print_usage(self);
            std::exit(0);
        }

        if (arg == "--version") {
            print_version();
            std::exit(0);
        }

        if (!has_command) {
            if (arg == "merge") {
                args.command = Command::Merge;
            } else if (arg == "audit") {
                args.command = Command::Audit;
            } else {
                fmt::print(stderr, "error: unknown command: '{}'\n", arg);
                print_usage(self);
                std::exit(1);
            }

            has_command = true;
        }

        else if (arg == "--verbose") {
            if (!it.next(arg)) {
                fmt::print(stderr, "error: missing argument for --verbose.\n");
                std::exit(1);
            }

            auto& verbose = args.merge.verbose;
            for (auto it : rv::split(arg, ',')) {
                std::string_view part{it.begin(), it.end()};

                if (part == "exe") {
                    verbose = verbose.with_exe();
                } else if (part == "load") {
                    verbose = verbose.with_load();
                } else if (part == "graph") {
                    verbose = verbose.with_graph();
                } else if (part == "order") {
                    verbose = verbose.with_order();
                } else {
                    fmt::print(stderr, "error: unknown verbose step: '{}'\n",
                               part);
                }
            }
        }

        else if (arg == "--dump") {
            if (!it.next(arg)) {
                fmt::print(stderr, "error: missing argument for --dump.\n");
                std::exit(1);
            }

            auto& dump = args.merge.dump;
            for (auto it : rv::split(arg, ',')) {
                std::string_view part{it.begin(), it.end()};

                if (part == "tokens") {
                    dump = dump.with_tokens();
                } else if (part == "ast") {
                    dump = dump.with_ast();
                } else if (part == "graph") {
                    dump = dump.with_graph();
                } else if (part == "renames") {
                    dump = dump.with_renames();
                } else if (part == "order") {
                    dump = dump.with_order();
                } else {
                    fmt::print(stderr, "error: unknown dump step: '{}'\n", part);
                }
            }
        }

        else if (arg == "--verify") {
            args.merge.verify = true;
        }

        else if (arg == "--no-verify") {
            args.merge.verify = false;
        }

        else if (arg == "-o" || arg == "--output") {
            if (has_output) {
                fmt::print(stderr, "error: output already provided\n");
                std::exit(1);
            }

            if (!it.next(arg)) {
                fmt::print(stderr, "error: missing output file path\n");
                std::exit(1);
            }

            args.merge.output = arg;
            has_output = true;
        }

        else if (arg == "--format") {
            if (!it.next(arg)) {
                fmt::print(stderr, "error: missing argument for --format.\n");
                std::exit(1);
            }

            if (arg == "text") {
                args.report_format = ReportFormat::Text;
            } else if (arg == "json") {
                args.report_format = ReportFormat::Json;
            } else {
                fmt::print(stderr, "error: invalid argument for --format: {}\n",
                           arg);
                std::exit(1);
            }
        }

        else if (arg == "--error-format") {
            if (!it.next(arg)) {
                fmt::print(stderr,
                           "error: missing argument for --error-format.\n");
                std::exit(1);
            }

            if (arg == "pretty") {
                args.error_format = fuse::ErrorReporterFormat::Pretty;
            } else if (arg == "json") {
                args.error_format = fuse::ErrorReporterFormat::Json;
            } else {
                fmt::print(stderr,
                           "error: invalid argument for --error-format: {}\n",
                           arg);
                std::exit(1);
            }
        }

        else if (args.program.empty()) {
            args.program = arg;
        }

        else if (args.command == Command::Merge && args.root.empty()) {
            args.root = arg;
        }

        else {
            fmt::print(stderr, "error: unknown option: '{}'\n", arg);
            std::exit(1);
        }
    }

    if (!has_command) {
        print_usage(self);
        std::exit(1);
    }

    if (args.program.empty()) {
        fmt::print(stderr, "error: missing required argument: {}\n",
                   args.command == Command::Merge ? "entry script" : "file");
        std::exit(1);
    }

    if (args.command == Command::Merge && args.root.empty()) {
        fmt::print(stderr, "error: missing required argument: project root\n");
        std::exit(1);
    }

    return args;
}

auto format_as(Command command) -> std::string_view {
    switch (command) {
        case Command::Merge: return "merge";
        case Command::Audit: return "audit";
    }

    return "?";
}

}  // namespace pyfuse

// ============================================================================

auto fmt::formatter<pyfuse::Command>::format(pyfuse::Command const& p,
                                             format_context&        ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(pyfuse::format_as(p), ctx);
}

auto fmt::formatter<pyfuse::Args>::format(pyfuse::Args const& p,
                                          format_context&     ctx) const
    -> format_context::iterator {
    return fmt::format_to(ctx.out(),
                          "Args{{command={}, program='{}', root='{}', "
                          "output='{}', verify={}, dump={}, verbose={}}}",
                          p.command, p.program, p.root,
                          p.merge.output.string(), p.merge.verify, p.merge.dump,
                          p.merge.verbose);
}
