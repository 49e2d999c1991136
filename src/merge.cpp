#include "merge.hpp"

#include <array>
#include <nlohmann/json.hpp>
#include <ranges>
#include <string>
#include <vector>

#include "audit.hpp"
#include "depgraph.hpp"
#include "emitter.hpp"
#include "fmt/format.h"
#include "fmt/ranges.h"
#include "libassert/assert.hpp"
#include "name-order.hpp"
#include "project.hpp"
#include "rename.hpp"
#include "tokenizer.hpp"

namespace rv = std::ranges::views;

namespace fuse {

namespace fs = std::filesystem;

auto default_output_path(fs::path const& entry) -> fs::path {
    auto name = entry.stem().string() + "_merged.py";
    return entry.parent_path() / name;
}

auto merge_project(FileStore& fs, fs::path const& entry, fs::path const& root,
                   MergeOptions const& options, FILE* log) -> MergeResult {
    auto const& verbose = options.verbose;

    Project project{fs, root, verbose.has_load() ? log : nullptr};
    project.load(entry);

    if (options.dump.has_tokens() || options.dump.has_ast()) {
        auto const& m = project.get_entry();
        auto        file = fs.get_file_by_id(m.fileid);
        ASSERT(file.has_value());

        if (options.dump.has_tokens()) {
            nlohmann::json j = tokenize(file->contents, m.fileid);
            fmt::print(log, "{}\n", j.dump(2));
        }

        if (options.dump.has_ast()) {
            fmt::print(log, "{}\n",
                       ast::dump_node(project.get_ast(), m.root).dump(2));
        }
    }

    project.link();
    if (verbose.has_exe()) {
        fmt::print(log, "linked {} modules, {} symbols\n",
                   project.get_modules().size(),
                   project.get_catalog().symbol_count());
    }

    auto graph = build_dependency_graph(project);
    if (verbose.has_graph()) {
        fmt::print(log,
                   "graph: {} units selected from {} modules, {} demoted to "
                   "module initialization\n",
                   graph.units.size(), graph.modules.size(),
                   graph.demoted.size());
    }

    if (options.dump.has_graph()) dump_dependency_graph(log, project, graph);

    auto plan = resolve_conflicts(project, graph);
    if (options.dump.has_renames()) dump_rename_plan(log, project, plan);

    auto order = sort::order_units(project, graph);
    if (options.dump.has_order() || verbose.has_order())
        sort::dump_order(log, project, order);

    Emitter emitter{project, graph, plan};

    MergeResult result{
        .output = options.output.empty() ? default_output_path(entry)
                                         : options.output,
        .source = emitter.emit(order),
        .report = std::nullopt,
    };

    if (options.verify) {
        Auditor auditor;
        auto    passed = auditor.audit(result.source, result.output.string());
        if (verbose.has_exe())
            fmt::print(log, "verify: {}\n", passed ? "passed" : "failed");

        result.report = auditor.get_report();
    }

    return result;
}

auto format_as(DumpStep::Step step) -> std::string_view {
    std::string_view s;

    switch (step) {
        case DumpStep::None: s = "none"; break;
        case DumpStep::Tokens: s = "tokens"; break;
        case DumpStep::Ast: s = "ast"; break;
        case DumpStep::Graph: s = "graph"; break;
        case DumpStep::Renames: s = "renames"; break;
        case DumpStep::Order: s = "order"; break;
    }

    return s;
}

auto format_as(VerboseStep::Step step) -> std::string_view {
    std::string_view name;

    switch (step) {
        case VerboseStep::None: name = "none"; break;
        case VerboseStep::Exe: name = "exe"; break;
        case VerboseStep::Load: name = "load"; break;
        case VerboseStep::Graph: name = "graph"; break;
        case VerboseStep::Order: name = "order"; break;
    }

    return name;
}

}  // namespace fuse

// ============================================================================

auto fmt::formatter<fuse::DumpStep>::format(fuse::DumpStep const& step,
                                            format_context&       ctx) const
    -> format_context::iterator {
    std::array steps{
        fuse::DumpStep::Tokens,  fuse::DumpStep::Ast,
        fuse::DumpStep::Graph,   fuse::DumpStep::Renames,
        fuse::DumpStep::Order,
    };

    std::vector<std::string_view> names;
    for (auto s : steps | rv::filter([&](auto s) { return step.has(s); }))
        names.push_back(fuse::format_as(s));

    return fmt::format_to(ctx.out(), "{}", fmt::join(names, ","));
}

auto fmt::formatter<fuse::VerboseStep>::format(fuse::VerboseStep const& step,
                                               format_context& ctx) const
    -> format_context::iterator {
    std::array steps{
        fuse::VerboseStep::Exe,
        fuse::VerboseStep::Load,
        fuse::VerboseStep::Graph,
        fuse::VerboseStep::Order,
    };

    std::vector<std::string_view> names;
    for (auto s : steps | rv::filter([&](auto s) { return step.has(s); }))
        names.push_back(fuse::format_as(s));

    return fmt::format_to(ctx.out(), "{}", fmt::join(names, ","));
}
