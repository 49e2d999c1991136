#pragma once

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "catalog-id.hpp"
#include "project.hpp"

namespace fuse {

/// The units needed to run the entry script, and the ordering edges between
/// them.
struct DependencyGraph {
    // every selected unit, in the order they were discovered from the entry
    std::vector<UnitId>        units;
    std::unordered_set<UnitId> selected;

    // definitions that must run with the statements of their module
    std::unordered_set<UnitId> demoted;

    // dependent -> dependencies, in discovery order. Only definitions and
    // methods have edges.
    std::unordered_map<UnitId, std::vector<UnitId>> edges;

    // modules with at least one selected unit, in discovery order
    std::vector<uint32_t> modules;

    [[nodiscard]] auto contains(UnitId u) const -> bool {
        return selected.contains(u);
    }

    [[nodiscard]] auto is_demoted(UnitId u) const -> bool {
        return demoted.contains(u);
    }

    [[nodiscard]] auto dependencies_of(UnitId u) const
        -> std::span<UnitId const>;

    /// Is the unit part of the ordered definitions, a selected definition or
    /// method that was not demoted.
    [[nodiscard]] auto is_ordered(Catalog const& catalog, UnitId u) const
        -> bool;
};

/// Compute the closure of the units needed by the statements and entry
/// block of the entry module.
[[nodiscard]] auto build_dependency_graph(Project const& project)
    -> DependencyGraph;

/// Human readable name of a unit, `pkg/mod.py::name`.
[[nodiscard]] auto describe_unit(Project const& project, UnitId u)
    -> std::string;

/// The definitions of a unit, or a short description for statements.
[[nodiscard]] auto unit_names(Project const& project, UnitId u)
    -> std::string;

/// Print the graph as a mermaid flowchart.
void dump_dependency_graph(FILE* out, Project const& project,
                           DependencyGraph const& graph);

}  // namespace fuse
