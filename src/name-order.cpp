#include "name-order.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <vector>

#include "errors.hpp"
#include "fmt/format.h"

namespace fuse::sort {

struct TopoSorter {
    void sort() {
        for (auto u : graph->units) {
            if (graph->is_ordered(*catalog, u)) visit(u);
        }
    }

    void visit(UnitId u) {
        if (perm.contains(u)) return;
        if (temp.contains(u)) {
            // graph has a least one cycle, and it starts at `u`
            report_cycle(u);
        }

        temp.insert(u);
        path.push_back(u);

        for (auto dep : graph->dependencies_of(u)) {
            if (graph->is_ordered(*catalog, dep)) visit(dep);
        }

        path.pop_back();
        perm.insert(u);
        sorted.push_back(u);
    }

    [[noreturn]] void report_cycle(UnitId u) const {
        auto start = std::ranges::find(path, u);

        std::vector<std::string> names;
        std::vector<Location>    locations;
        for (auto it = start; it != path.end(); it++) {
            auto const& unit = catalog->get_unit(*it);
            names.push_back(fmt::format("{}.{}",
                                        project->get_module(unit.module).name,
                                        unit_names(*project, *it)));
            locations.push_back(project->location_of(unit.node));
        }

        throw CircularDependencyError{std::move(names), std::move(locations)};
    }

    Project const*         project;
    Catalog const*         catalog;
    DependencyGraph const* graph;

    std::vector<UnitId>        sorted;
    std::vector<UnitId>        path;
    std::unordered_set<UnitId> temp;
    std::unordered_set<UnitId> perm;
};

auto order_units(Project const& project, DependencyGraph const& graph)
    -> std::vector<UnitId> {
    auto ts = TopoSorter{
        .project = &project,
        .catalog = &project.get_catalog(),
        .graph = &graph,
        .sorted = {},
        .path = {},
        .temp = {},
        .perm = {},
    };

    ts.sort();

    return ts.sorted;
}

void dump_order(FILE* out, Project const& project,
                std::span<UnitId const> order) {
    for (size_t i = 0; i < order.size(); i++)
        fmt::print(out, "order: {:>3} {}\n", i, describe_unit(project, order[i]));
}

}  // namespace fuse::sort
