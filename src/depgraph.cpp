#include "depgraph.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "libassert/assert.hpp"

namespace fuse {
using ast::NodeId;
using ast::NodeKind;

namespace {

struct GraphBuilder {
    Project const&   project;
    Catalog const&   catalog;
    DependencyGraph& g;

    std::vector<UnitId> worklist;
    std::vector<bool>   touched;

    void select(UnitId u) {
        if (!g.selected.insert(u).second) return;

        g.units.push_back(u);
        worklist.push_back(u);
    }

    void add_edge(UnitId from, UnitId to) {
        if (from == to) return;

        auto& deps = g.edges[from];
        if (std::ranges::find(deps, to) == deps.end()) deps.push_back(to);
    }

    // The first time a module is needed all of its top-level code that runs
    // on import is kept.
    void touch(uint32_t module) {
        if (touched.at(module)) return;
        touched.at(module) = true;
        g.modules.push_back(module);

        // only the first entry block of the entry module is kept
        auto const& table = catalog.get_module(module);
        auto        entry_block = table.is_entry;
        for (auto u : table.units) {
            switch (catalog.get_unit(u).kind) {
                case UnitKind::Statement:
                case UnitKind::Import:
                case UnitKind::GuardedImport: select(u); break;
                case UnitKind::EntryBlock:
                    if (entry_block) select(u);
                    entry_block = false;
                    break;
                case UnitKind::Definition:
                case UnitKind::Method:
                case UnitKind::Docstring: break;
            }
        }
    }

    void touch_by_name(std::string_view dotted) {
        for (size_t dot = dotted.find('.'); dot != std::string_view::npos;
             dot = dotted.find('.', dot + 1)) {
            if (auto m = project.find_module(dotted.substr(0, dot))) touch(*m);
        }

        if (auto m = project.find_module(dotted)) touch(*m);
    }

    void touch_imported(uint32_t module, NodeId stmt) {
        auto const& ast = project.get_ast();
        if (ast.kind_of(stmt) == NodeKind::Import) {
            for (auto alias : ast.children(stmt))
                touch_by_name(ast.get(alias).str);
            return;
        }

        auto base = project.absolute_module(module, stmt);
        if (base.empty()) return;

        touch_by_name(base);
        for (auto alias : ast.children(stmt)) {
            if (auto m = project.find_module(
                    fmt::format("{}.{}", base, ast.get(alias).str)))
                touch(*m);
        }
    }

    // the units that bind the symbol at the top-level of its module
    [[nodiscard]] auto binding_units(Symbol const& s) const
        -> std::vector<UnitId> {
        std::vector<UnitId> top;
        std::vector<UnitId> nested;
        for (auto const& b : s.bindings) {
            if (b.unit.is_invalid()) continue;

            auto& out = catalog.scope_of(b.node) == s.scope ? top : nested;
            if (std::ranges::find(out, b.unit) == out.end())
                out.push_back(b.unit);
        }

        // only bound through `global` in functions
        return top.empty() ? nested : top;
    }

    void depend(UnitId from, NodeId ref, bool ordered) {
        auto target = project.ref_target(ref);
        if (target.symbol.is_invalid()) return;

        auto const& s = catalog.get_symbol(target.symbol);
        if (catalog.get_scope(s.scope).kind != ScopeKind::Module) return;

        for (auto u : binding_units(s)) {
            select(u);
            if (ordered && catalog.get_unit(u).kind == UnitKind::Definition)
                add_edge(from, u);
        }
    }

    void process(UnitId u) {
        auto const& unit = catalog.get_unit(u);
        touch(unit.module);

        if (unit.owner.is_valid()) {
            select(unit.owner);
            add_edge(u, unit.owner);
        }

        for (auto m : unit.methods) select(m);

        for (auto ref : unit.eager_refs) depend(u, ref, true);
        for (auto ref : unit.lazy_refs) depend(u, ref, true);
        for (auto ref : unit.weak_refs) depend(u, ref, false);

        for (auto stmt : unit.imports) touch_imported(unit.module, stmt);
    }

    // Does reading the name need a statement of some module to have run.
    [[nodiscard]] auto reads_anchored(UnitId from, NodeId ref) const -> bool {
        auto const& node = project.get_ast().get(ref);
        if (node.is_store()) return false;

        auto target = project.ref_target(ref);
        if (target.symbol.is_invalid()) return false;

        auto const& s = catalog.get_symbol(target.symbol);
        if (catalog.get_scope(s.scope).kind != ScopeKind::Module) return false;

        for (auto u : binding_units(s)) {
            if (u == from) continue;

            auto kind = catalog.get_unit(u).kind;
            if (kind == UnitKind::Statement || kind == UnitKind::EntryBlock ||
                g.is_demoted(u))
                return true;
        }

        return read_by_statement(from, s.module, target.symbol);
    }

    // Does a statement of the module that binds `sym` read it before `from`
    // runs. Such a statement can change the object, `items.append(x)`.
    [[nodiscard]] auto read_by_statement(UnitId from, uint32_t module,
                                         SymbolId sym) const -> bool {
        auto const same_module = catalog.get_unit(from).module == module;
        auto reads = [&](NodeId ref) {
            return project.ref_target(ref).symbol == sym;
        };

        for (auto u : catalog.get_module(module).units) {
            if (same_module && u == from) break;
            if (!g.contains(u)) continue;

            auto const& unit = catalog.get_unit(u);
            if (unit.kind != UnitKind::Statement) continue;
            if (std::ranges::any_of(unit.eager_refs, reads)) return true;
        }

        return false;
    }

    void demote() {
        for (auto changed = true; changed;) {
            changed = false;
            for (auto u : g.units) {
                auto const& unit = catalog.get_unit(u);
                if (unit.kind != UnitKind::Definition || g.is_demoted(u))
                    continue;

                // decorators of methods run with the class body
                auto reads = [&](NodeId ref) { return reads_anchored(u, ref); };
                auto anchored = std::ranges::any_of(unit.eager_refs, reads);
                for (auto m : unit.methods) {
                    anchored = anchored || std::ranges::any_of(
                                               catalog.get_unit(m).eager_refs,
                                               reads);
                }
                if (!anchored) continue;

                g.demoted.insert(u);
                changed = true;
            }
        }
    }

    void build() {
        touch(project.get_entry().index);

        while (!worklist.empty()) {
            auto u = worklist.back();
            worklist.pop_back();
            process(u);
        }

        demote();
    }
};

}  // namespace

auto DependencyGraph::dependencies_of(UnitId u) const
    -> std::span<UnitId const> {
    if (auto it = edges.find(u); it != edges.end()) return it->second;
    return {};
}

auto DependencyGraph::is_ordered(Catalog const& catalog, UnitId u) const
    -> bool {
    return contains(u) && !is_demoted(u) && catalog.get_unit(u).is_definition();
}

auto build_dependency_graph(Project const& project) -> DependencyGraph {
    DependencyGraph g;

    GraphBuilder b{
        .project = project,
        .catalog = project.get_catalog(),
        .g = g,
        .worklist = {},
        .touched = std::vector<bool>(project.get_modules().size(), false),
    };

    b.build();
    return g;
}

auto unit_names(Project const& project, UnitId u) -> std::string {
    auto const& catalog = project.get_catalog();
    auto const& ast = project.get_ast();
    auto const& unit = catalog.get_unit(u);

    if (unit.kind == UnitKind::Method) {
        return fmt::format("{}.{}", ast.get(catalog.get_unit(unit.owner).node).str,
                           ast.get(unit.node).str);
    }

    if (!unit.defines.empty()) {
        std::vector<std::string_view> names;
        for (auto sym : unit.defines) names.push_back(catalog.get_symbol(sym).name);
        return fmt::format("{}", fmt::join(names, ", "));
    }

    auto const& node = ast.get(unit.node);
    if (node.is_oneof(NodeKind::FunctionDef, NodeKind::ClassDef))
        return std::string{node.str};

    auto const& m = project.get_module(unit.module);
    auto file = project.get_file_store().get_file_by_id(m.fileid);
    ASSERT(file.has_value());

    return fmt::format("<{} at line {}>", unit.kind,
                       file->line_of(node.span.begin));
}

auto describe_unit(Project const& project, UnitId u) -> std::string {
    auto const& unit = project.get_catalog().get_unit(u);
    return fmt::format("{}::{}", project.get_module(unit.module).relpath,
                       unit_names(project, u));
}

void dump_dependency_graph(FILE* out, Project const& project,
                           DependencyGraph const& graph) {
    auto const& catalog = project.get_catalog();

    fmt::print(out, "flowchart TD\n");
    for (auto u : graph.units) {
        auto const& unit = catalog.get_unit(u);
        if (!unit.is_definition() && !graph.is_demoted(u)) continue;

        fmt::print(out, "    u{}[\"{}{}\"]\n", u.value(),
                   describe_unit(project, u),
                   graph.is_demoted(u) ? " (init)" : "");
    }

    for (auto u : graph.units) {
        for (auto dep : graph.dependencies_of(u))
            fmt::print(out, "    u{} --> u{}\n", u.value(), dep.value());
    }
}

}  // namespace fuse
