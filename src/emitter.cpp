#include "emitter.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "libassert/assert.hpp"

namespace fuse {
using ast::NodeId;
using ast::NodeKind;

namespace {

auto first_segment(std::string_view dotted) -> std::string_view {
    return dotted.substr(0, dotted.find('.'));
}

// the value assigned to `__all__` by a top-level statement
auto all_value(ast::Ast const& ast, NodeId stmt) -> NodeId {
    auto is_all = [&](NodeId target) {
        auto const& node = ast.get(target);
        return node.kind == NodeKind::Name && node.str == "__all__";
    };

    auto ch = ast.children(stmt);
    switch (ast.kind_of(stmt)) {
        case NodeKind::Assign:
            if (std::ranges::any_of(ch.first(ch.size() - 1), is_all))
                return ch.back();
            break;
        case NodeKind::AugAssign:
            if (is_all(ch[0])) return ch[1];
            break;
        case NodeKind::AnnAssign:
            if (is_all(ch[0])) return ch[2];
            break;
        default: break;
    }

    return NodeId::invalid();
}

}  // namespace

auto RenderedUnit::apply() const -> std::string {
    auto sorted = edits;
    std::ranges::sort(sorted, [](Edit const& a, Edit const& b) {
        if (a.span.begin != b.span.begin) return a.span.begin < b.span.begin;
        return a.span.end > b.span.end;
    });

    std::string result;
    auto        cursor = span.begin;
    for (auto const& e : sorted) {
        if (e.span.begin < cursor) continue;

        result += source.substr(cursor, e.span.begin - cursor);
        result += e.text;
        cursor = e.span.end;
    }

    result += source.substr(cursor, span.end - cursor);
    return result;
}

// ============================================================================

auto Emitter::source_of(uint32_t module) const -> std::string_view {
    auto file = project->get_file_store().get_file_by_id(
        project->get_module(module).fileid);
    ASSERT(file.has_value());

    return file->contents;
}

auto Emitter::render_unit(UnitId u) -> RenderedUnit {
    auto const& unit = catalog->get_unit(u);

    RenderedUnit r{
        .unit = u,
        .node = unit.node,
        .span = ast->get(unit.node).span,
        .source = source_of(unit.module),
        .edits = {},
    };

    add_name_edits(r, u);
    add_import_edits(r, u);

    // methods are part of the text of their class
    for (auto m : unit.methods) {
        add_name_edits(r, m);
        add_import_edits(r, m);
    }

    add_all_edits(r);
    return r;
}

void Emitter::add_name_edits(RenderedUnit& r, UnitId u) const {
    auto const& unit = catalog->get_unit(u);

    auto add = [&](NodeId name) {
        auto target = project->ref_target(name);
        if (target.symbol.is_invalid()) return;

        auto text = catalog->get_symbol(target.symbol).emitted_name();
        if (target.node == name && text == ast->get(name).str) return;

        r.edits.push_back(
            {.span = ast->get(target.node).span, .text = std::string{text}});
    };

    for (auto name : unit.eager_refs) add(name);
    for (auto name : unit.lazy_refs) add(name);
    for (auto name : unit.weak_refs) add(name);
}

auto Emitter::bound_name(NodeId binding, std::string_view fallback) const
    -> std::string_view {
    auto sym = catalog->symbol_bound_by(binding);
    if (sym.is_invalid()) return fallback;
    return catalog->get_symbol(sym).emitted_name();
}

auto Emitter::alias_text(NodeId alias) const -> std::string {
    auto const& node = ast->get(alias);
    auto        is_from = ast->kind_of(ast->parent(alias)) == NodeKind::ImportFrom;

    if (auto asname = ast->child(alias, 0); asname.is_valid()) {
        return fmt::format("{} as {}", node.str,
                           bound_name(asname, ast->get(asname).str));
    }

    auto original = is_from ? node.str : first_segment(node.str);
    auto name = bound_name(alias, original);
    if (name == original) return std::string{node.str};

    return fmt::format("{} as {}", is_from ? node.str : original, name);
}

// Internal imports are dropped, their uses were already renamed to the
// definitions they import.
void Emitter::add_import_edits(RenderedUnit& r, UnitId u) const {
    for (auto stmt : catalog->get_unit(u).imports) {
        auto const& node = ast->get(stmt);

        std::vector<std::string> kept;
        auto                     dropped = false;
        for (auto alias : ast->children(stmt)) {
            if (project->is_internal_alias(alias)) {
                dropped = true;
                continue;
            }

            kept.push_back(alias_text(alias));
        }

        if (!dropped) {
            for (auto alias : ast->children(stmt)) {
                if (ast->child(alias, 0).is_valid()) continue;

                auto text = alias_text(alias);
                if (text != ast->get(alias).str)
                    r.edits.push_back({.span = ast->get(alias).span,
                                       .text = std::move(text)});
            }

            continue;
        }

        std::string text;
        if (kept.empty()) {
            text = "pass";
        } else if (node.kind == NodeKind::Import) {
            text = fmt::format("import {}", fmt::join(kept, ", "));
        } else {
            text = fmt::format("from {}{} import {}",
                               std::string(node.get_level(), '.'), node.str,
                               fmt::join(kept, ", "));
        }

        r.edits.push_back({.span = node.span, .text = std::move(text)});
    }
}

// Names listed in `__all__` follow the definitions they name.
void Emitter::add_all_edits(RenderedUnit& r) {
    auto value = all_value(*ast, r.node);
    if (value.is_invalid() ||
        !ast->get(value).is_oneof(NodeKind::List, NodeKind::Tuple))
        return;

    auto const& unit = catalog->get_unit(r.unit);
    auto const& scope =
        catalog->get_scope(catalog->get_module(unit.module).scope);

    for (auto elt : ast->children(value)) {
        auto const& node = ast->get(elt);
        if (node.kind != NodeKind::Str || node.flags != 0) continue;

        auto body = ast::string_literal_body(node.str);
        auto sym = scope.find(body);
        if (sym.is_invalid()) continue;

        if (catalog->get_symbol(sym).kind == SymbolKind::Import) {
            sym = project->alias_target(sym).symbol;
            if (sym.is_invalid()) continue;
        }

        auto name = catalog->get_symbol(sym).emitted_name();
        if (name == body) continue;

        auto offset = static_cast<uint32_t>(body.data() - node.str.data());
        auto begin = node.span.begin + offset;
        r.edits.push_back({
            .span = {.begin = begin,
                     .end = begin + static_cast<uint32_t>(body.size())},
            .text = std::string{name},
        });
    }
}

// ============================================================================

void Emitter::block(std::string_view text, uint32_t blank_lines) {
    if (text.empty()) return;

    if (!out.empty()) out.append(blank_lines, '\n');
    out += text;
    out += '\n';
}

auto Emitter::emit(std::span<UnitId const> order) -> std::string {
    out.clear();

    auto const& entry = project->get_entry();
    auto const& entry_table = catalog->get_module(entry.index);

    block(fmt::format("# Generated by pyfuse from {}. Do not edit.",
                      entry.relpath));

    // the docstring of the entry script stays the docstring of the file
    if (!entry_table.units.empty()) {
        auto const& first = catalog->get_unit(entry_table.units.front());
        if (first.kind == UnitKind::Docstring)
            block(ast->get(first.node).span.str(source_of(entry.index)), 1);
    }

    std::vector<std::string> future;
    std::vector<std::string> imports;
    for (auto const& imp : plan->imports)
        (imp.is_future() ? future : imports).push_back(imp.render());

    block(fmt::format("{}", fmt::join(future, "\n")), 1);
    block(fmt::format("{}", fmt::join(imports, "\n")), 1);

    for (auto m : project->get_load_order()) {
        for (auto u : catalog->get_module(m).units) {
            if (!graph->contains(u) ||
                catalog->get_unit(u).kind != UnitKind::GuardedImport)
                continue;

            block(fmt::format("# From {}\n{}", project->get_module(m).relpath,
                              render_unit(u).apply()));
        }
    }

    for (auto u : order) {
        auto const& unit = catalog->get_unit(u);
        if (unit.kind == UnitKind::Method) continue;

        block(fmt::format("# From {}\n{}",
                          project->get_module(unit.module).relpath,
                          render_unit(u).apply()));
    }

    // statements of a module, with the definitions that need them to have
    // run
    auto statements_of = [&](uint32_t m) {
        std::vector<std::string> lines;
        for (auto u : catalog->get_module(m).units) {
            if (!graph->contains(u)) continue;

            auto kind = catalog->get_unit(u).kind;
            if (kind == UnitKind::Statement || graph->is_demoted(u))
                lines.push_back(render_unit(u).apply());
        }

        return lines;
    };

    auto has_init = false;
    for (auto m : project->get_load_order()) {
        if (m == entry.index) continue;

        auto lines = statements_of(m);
        if (lines.empty()) continue;

        if (!has_init) block("# Module initialization statements");
        has_init = true;

        block(fmt::format("# From {}\n{}", project->get_module(m).relpath,
                          fmt::join(lines, "\n")),
              1);
    }

    auto main_lines = statements_of(entry.index);
    if (!main_lines.empty()) {
        block(fmt::format("# Main script code\n{}", fmt::join(main_lines, "\n")));
    }

    for (auto u : entry_table.units) {
        if (graph->contains(u) &&
            catalog->get_unit(u).kind == UnitKind::EntryBlock)
            block(render_unit(u).apply());
    }

    return out;
}

}  // namespace fuse
