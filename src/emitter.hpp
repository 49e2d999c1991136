#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "catalog-id.hpp"
#include "depgraph.hpp"
#include "location.hpp"
#include "project.hpp"
#include "rename.hpp"

namespace fuse {

/// Replace the text in `span` with `text`.
struct Edit {
    Span        span;
    std::string text;
};

/// The text of one unit and the edits needed to rename what it references.
/// The original `Ast` is never changed.
struct RenderedUnit {
    UnitId      unit;
    ast::NodeId node;
    Span        span;

    // the whole file the unit is in
    std::string_view source;

    std::vector<Edit> edits;

    /// The source of the unit with every edit applied. Edits that fall inside
    /// of an earlier, larger edit are skipped.
    [[nodiscard]] auto apply() const -> std::string;
};

/// Writes the merged file. Nothing is resolved here, every decision was
/// already made by the graph builder, the conflict resolver and the orderer.
class Emitter {
public:
    Emitter(Project& project, DependencyGraph const& graph,
            RenamePlan const& plan)
        : project{&project},
          catalog{&project.get_catalog()},
          ast{&project.get_ast()},
          graph{&graph},
          plan{&plan} {}

    [[nodiscard]] auto render_unit(UnitId u) -> RenderedUnit;

    /// Produce the merged file given the ordered definitions.
    [[nodiscard]] auto emit(std::span<UnitId const> order) -> std::string;

private:
    void add_name_edits(RenderedUnit& r, UnitId u) const;
    void add_import_edits(RenderedUnit& r, UnitId u) const;
    void add_all_edits(RenderedUnit& r);

    [[nodiscard]] auto alias_text(ast::NodeId alias) const -> std::string;
    [[nodiscard]] auto bound_name(ast::NodeId binding,
                                  std::string_view fallback) const
        -> std::string_view;

    [[nodiscard]] auto source_of(uint32_t module) const -> std::string_view;

    void block(std::string_view text, uint32_t blank_lines = 2);

private:
    Project*               project;
    Catalog const*         catalog;
    ast::Ast const*        ast;
    DependencyGraph const* graph;
    RenamePlan const*      plan;

    std::string out;
};

}  // namespace fuse
