#pragma once

#include <cstdio>
#include <span>
#include <vector>

#include "catalog-id.hpp"
#include "depgraph.hpp"
#include "project.hpp"

namespace fuse::sort {

/// Order the selected definitions so that every unit comes after the units
/// it depends on. Units with no relation keep the order they were discovered
/// in. Throws `CircularDependencyError` when there is no such order.
[[nodiscard]] auto order_units(Project const& project,
                               DependencyGraph const& graph)
    -> std::vector<UnitId>;

void dump_order(FILE* out, Project const& project,
                std::span<UnitId const> order);

}  // namespace fuse::sort
