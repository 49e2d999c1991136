#pragma once

#include <cstdio>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "catalog-id.hpp"
#include "depgraph.hpp"
#include "project.hpp"

namespace fuse {

/// An import of a module from outside of the project, as it is written to
/// the merged file.
struct ExternalImport {
    // `a.b` in `import a.b` and in `from a.b import c`
    std::string module;
    // `c` in `from a.b import c`, empty for `import`
    std::string name;
    // the name bound in the merged file
    std::string alias;

    bool is_from;
    bool has_asname;

    /// `import a.b` binds `a`, the alias it would bind without renaming.
    [[nodiscard]] auto default_alias() const -> std::string_view;

    [[nodiscard]] auto is_future() const -> bool {
        return is_from && module == "__future__";
    }

    [[nodiscard]] auto render() const -> std::string;

    [[nodiscard]] auto operator==(ExternalImport const& o) const
        -> bool = default;
};

/// What the conflict resolver decided.
struct RenamePlan {
    // deduplicated external imports, in discovery order
    std::vector<ExternalImport> imports;

    // top-level external aliases to their entry in `imports`
    std::unordered_map<SymbolId, size_t> import_of;

    // symbols that got a qualified name, in the order they were renamed
    std::vector<SymbolId> renamed;
};

/// `pkg_mod_name` for `name` defined in `pkg/mod.py`.
[[nodiscard]] auto qualified_name_for(Module const& module,
                                      std::string_view name) -> std::string;

/// Find the module-level names that would collide in the merged file and
/// give them qualified names. Only colliding symbols are renamed.
[[nodiscard]] auto resolve_conflicts(Project& project,
                                     DependencyGraph const& graph)
    -> RenamePlan;

/// Print every renamed symbol, one per line.
void dump_rename_plan(FILE* out, Project const& project,
                      RenamePlan const& plan);

}  // namespace fuse
