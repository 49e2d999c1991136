#include "rename.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "builtins.hpp"
#include "fmt/format.h"
#include "libassert/assert.hpp"

namespace fuse {
using ast::NodeId;
using ast::NodeKind;

namespace {

auto first_segment(std::string_view dotted) -> std::string_view {
    return dotted.substr(0, dotted.find('.'));
}

struct ImportParticipant {
    SymbolId       symbol;
    ExternalImport imp;

    // what the alias denotes, two imports with the same key bind the same
    // object
    std::string key;
};

struct ConflictResolver {
    Project&               project;
    Catalog&               catalog;
    DependencyGraph const& graph;
    RenamePlan&            plan;

    std::vector<SymbolId>                                 defs;
    std::unordered_set<SymbolId>                          seen;
    std::unordered_map<std::string_view, std::vector<SymbolId>> by_name;
    std::vector<ImportParticipant>                        imports;
    std::unordered_set<std::string>                       taken;

    // builtins still read by name in the merged file
    std::unordered_set<std::string_view> builtins;

    void add_builtins(Unit const& unit) {
        auto const& ast = project.get_ast();
        for (auto const* refs :
             {&unit.eager_refs, &unit.lazy_refs, &unit.weak_refs}) {
            for (auto ref : *refs) {
                if (project.ref_target(ref).symbol.is_valid()) continue;

                auto name = ast.get(ref).str;
                if (!is_builtin(name)) continue;

                builtins.insert(name);
                taken.emplace(name);
            }
        }
    }

    [[nodiscard]] auto occupied(std::string_view name, size_t owners) const
        -> bool {
        return owners >= 2 || builtins.contains(name);
    }

    void add_def(SymbolId sym) {
        if (!seen.insert(sym).second) return;

        defs.push_back(sym);
        by_name[catalog.get_symbol(sym).name].push_back(sym);
        taken.emplace(catalog.get_symbol(sym).name);
    }

    void add_import(NodeId alias) {
        auto const& ast = project.get_ast();
        auto const& stmt = ast.get(ast.parent(alias));
        auto const& node = ast.get(alias);
        auto        asname = ast.child(alias, 0);

        ExternalImport imp{
            .module = stmt.kind == NodeKind::ImportFrom ? std::string{stmt.str}
                                                        : std::string{node.str},
            .name = stmt.kind == NodeKind::ImportFrom ? std::string{node.str}
                                                      : std::string{},
            .alias = {},
            .is_from = stmt.kind == NodeKind::ImportFrom,
            .has_asname = asname.is_valid(),
        };

        imp.alias = asname.is_valid() ? std::string{ast.get(asname).str}
                                      : std::string{imp.default_alias()};

        auto key = imp.is_from ? fmt::format("from {} import {}", imp.module,
                                             imp.name)
                   : imp.has_asname ? fmt::format("import {}", imp.module)
                                    : fmt::format("import {}",
                                                  first_segment(imp.module));

        auto sym = catalog.symbol_bound_by(asname.is_valid() ? asname : alias);
        ASSERT(sym.is_valid(), "import alias binds nothing", alias);

        taken.emplace(imp.alias);
        imports.push_back(
            {.symbol = sym, .imp = std::move(imp), .key = std::move(key)});
    }

    void collect() {
        auto const& ast = project.get_ast();

        for (auto u : graph.units) {
            auto const& unit = catalog.get_unit(u);
            add_builtins(unit);
            for (auto m : unit.methods) add_builtins(catalog.get_unit(m));

            switch (unit.kind) {
                case UnitKind::Import:
                    for (auto alias : ast.children(unit.node)) {
                        if (!project.is_internal_alias(alias)) add_import(alias);
                    }
                    break;

                case UnitKind::Definition:
                case UnitKind::GuardedImport:
                case UnitKind::EntryBlock:
                case UnitKind::Statement:
                    for (auto sym : unit.defines) add_def(sym);
                    break;

                case UnitKind::Method:
                case UnitKind::Docstring: break;
            }
        }
    }

    auto unique(std::string const& base) -> std::string {
        auto name = base;
        for (uint32_t i = 2; taken.contains(name); i++)
            name = fmt::format("{}_{}", base, i);

        taken.insert(name);
        return name;
    }

    void rename(SymbolId sym, std::string name) {
        catalog.set_qualified_name(sym, std::move(name));
        plan.renamed.push_back(sym);
    }

    void rename_defs() {
        for (auto sym : defs) {
            auto const& s = catalog.get_symbol(sym);
            if (!occupied(s.name, by_name.at(s.name).size())) continue;

            auto const& m = project.get_module(s.module);
            rename(sym, unique(qualified_name_for(m, s.name)));
        }
    }

    void rename_imports() {
        // alias -> key of the import that keeps it
        std::unordered_map<std::string, std::string> kept;
        // key -> alias given to renamed imports
        std::unordered_map<std::string, std::string> given;

        std::unordered_set<SymbolId> named;
        for (auto& p : imports) {
            if (p.imp.is_future()) {
                add(std::move(p.imp), p.symbol);
                continue;
            }

            auto const& original = p.imp.alias;
            auto        keeps = !by_name.contains(original) &&
                         !builtins.contains(original);
            if (keeps) {
                auto [it, _] = kept.try_emplace(original, p.key);
                keeps = it->second == p.key;
            }

            if (!keeps) {
                auto it = given.find(p.key);
                if (it == given.end()) {
                    auto base = fmt::format("{}_{}", original,
                                            first_segment(p.imp.module));
                    it = given.emplace(p.key, unique(base)).first;
                }

                if (named.insert(p.symbol).second) rename(p.symbol, it->second);
                p.imp.alias = it->second;
            }

            add(std::move(p.imp), p.symbol);
        }
    }

    void add(ExternalImport imp, SymbolId sym) {
        auto it = std::ranges::find(plan.imports, imp);
        if (it == plan.imports.end()) {
            plan.imports.push_back(std::move(imp));
            it = plan.imports.end() - 1;
        }

        plan.import_of.try_emplace(
            sym, static_cast<size_t>(it - plan.imports.begin()));
    }
};

}  // namespace

auto ExternalImport::default_alias() const -> std::string_view {
    if (is_from) return name;
    return first_segment(module);
}

auto ExternalImport::render() const -> std::string {
    if (is_from) {
        if (alias == name) return fmt::format("from {} import {}", module, name);
        return fmt::format("from {} import {} as {}", module, name, alias);
    }

    if (has_asname) return fmt::format("import {} as {}", module, alias);
    if (alias == default_alias()) return fmt::format("import {}", module);

    // the submodules of a renamed `import a.b` must be imported elsewhere
    return fmt::format("import {} as {}", default_alias(), alias);
}

auto qualified_name_for(Module const& module, std::string_view name)
    -> std::string {
    auto prefix = module.name;
    std::ranges::replace(prefix, '.', '_');
    return fmt::format("{}_{}", prefix, name);
}

auto resolve_conflicts(Project& project, DependencyGraph const& graph)
    -> RenamePlan {
    RenamePlan plan;

    ConflictResolver r{
        .project = project,
        .catalog = project.get_catalog(),
        .graph = graph,
        .plan = plan,
        .defs = {},
        .seen = {},
        .by_name = {},
        .imports = {},
        .taken = {},
        .builtins = {},
    };

    r.collect();
    r.rename_defs();
    r.rename_imports();

    return plan;
}

void dump_rename_plan(FILE* out, Project const& project,
                      RenamePlan const& plan) {
    auto const& catalog = project.get_catalog();
    for (auto sym : plan.renamed) {
        auto const& s = catalog.get_symbol(sym);
        fmt::print(out, "rename: {}::{} -> {}\n",
                   project.get_module(s.module).relpath, s.name,
                   s.qualified_name);
    }
}

}  // namespace fuse
