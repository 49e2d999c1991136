#include "audit.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "fmt/format.h"
#include "libassert/assert.hpp"
#include "parser.hpp"
#include "resolver.hpp"

namespace fuse {
using ast::NodeId;
using ast::NodeKind;

void MultipleEntryBlocksCheck::run(AuditContext const& ctx,
                                   Report& report) const {
    std::vector<uint32_t> lines;
    for (auto stmt : ctx.ast.children(ctx.root)) {
        if (is_entry_block(ctx.ast, stmt)) lines.push_back(ctx.line_of(stmt));
    }

    if (lines.size() < 2) return;

    auto message = fmt::format(
        "found {} top-level `if __name__ == \"__main__\":` blocks",
        lines.size());
    report.add_error(FindingKind::MultipleEntryBlocks, std::move(message),
                     std::move(lines));
}

void RelativeImportCheck::run(AuditContext const& ctx, Report& report) const {
    auto const& table = ctx.catalog.get_module(0);
    for (auto stmt : table.imports) {
        auto const& node = ctx.ast.get(stmt);
        if (node.kind != NodeKind::ImportFrom || node.get_level() == 0)
            continue;

        report.add_warning(
            FindingKind::RelativeImport,
            fmt::format("relative import from '{}{}' will not work once the "
                        "file is moved",
                        std::string(node.get_level(), '.'), node.str),
            {ctx.line_of(stmt)});
    }
}

void ConditionalImportCheck::run(AuditContext const& ctx,
                                 Report& report) const {
    auto is_conditional = [&](NodeId stmt) {
        auto conditional = false;
        for (auto id = ctx.ast.parent(stmt); id.is_valid();
             id = ctx.ast.parent(id)) {
            switch (ctx.ast.kind_of(id)) {
                case NodeKind::FunctionDef:
                case NodeKind::Lambda: return false;
                case NodeKind::While:
                case NodeKind::Try: conditional = true; break;
                case NodeKind::If:
                    if (!is_entry_block(ctx.ast, id)) conditional = true;
                    break;
                default: break;
            }
        }

        return conditional;
    };

    auto const& table = ctx.catalog.get_module(0);
    for (auto stmt : table.imports) {
        if (!is_conditional(stmt)) continue;

        report.add_warning(FindingKind::ConditionalImport,
                           "import only runs under a condition, every branch "
                           "is treated as taken",
                           {ctx.line_of(stmt)});
    }
}

// ============================================================================

Auditor::Auditor() {
    add_check(std::make_unique<MultipleEntryBlocksCheck>());
    add_check(std::make_unique<RelativeImportCheck>());
    add_check(std::make_unique<ConditionalImportCheck>());
}

auto Auditor::get_report() const -> Report const& {
    ASSERT(report.has_value(), "audit was never run");
    return *report;
}

auto Auditor::audit(std::string_view source, std::string_view display_path)
    -> bool {
    report.emplace(std::string{display_path});

    FileStore fs;
    auto      fileid = fs.add_file_and_contents(display_path, source);
    auto      file = fs.get_file_by_id(fileid);
    ASSERT(file.has_value());

    ast::Ast ast;
    NodeId   root;
    try {
        root = parse_source(file->contents, fileid, ast);
    } catch (ParseError const& e) {
        auto loc = e.get_locations().front();
        report->add_error(FindingKind::ParseFailure, e.get_message(),
                          {file->line_of(loc.span.begin)});
        return false;
    }

    Catalog catalog{ast};
    catalog.add_module(root, fileid, true);

    AuditContext ctx{
        .ast = ast,
        .catalog = catalog,
        .file = *file,
        .root = root,
    };

    check_duplicates(ctx, *report);
    check_references(ctx, *report);
    for (auto const& check : checks) check->run(ctx, *report);

    return report->passed();
}

void Auditor::check_duplicates(AuditContext const& ctx, Report& report) const {
    auto module_scope = ctx.catalog.get_module(0).scope;

    // symbol -> lines of every conflicting binding, in the order found
    std::vector<SymbolId>                                     order;
    std::unordered_map<SymbolId, std::vector<uint32_t>>       lines;
    for (auto const& d : ctx.catalog.get_duplicates()) {
        if (ctx.catalog.get_symbol(d.symbol).scope != module_scope) continue;

        auto [it, inserted] = lines.try_emplace(d.symbol);
        if (inserted) order.push_back(d.symbol);

        it->second.push_back(ctx.line_of(d.first));
        it->second.push_back(ctx.line_of(d.second));
    }

    for (auto sym : order) {
        report.add_error(
            FindingKind::DuplicateDefinition,
            fmt::format("'{}' is defined more than once at the top-level",
                        ctx.catalog.get_symbol(sym).name),
            std::move(lines.at(sym)));
    }
}

void Auditor::check_references(AuditContext const& ctx, Report& report) const {
    Resolver resolver{ctx.ast, ctx.catalog};
    resolver.resolve();
    resolver.validate_attributes();

    struct Group {
        std::string_view      name;
        bool                  is_attribute;
        std::vector<uint32_t> lines;
    };

    std::vector<Group> groups;
    for (auto const& u : resolver.get_unresolved()) {
        auto is_attribute = ctx.ast.kind_of(u.node) == NodeKind::Attribute;

        auto it = std::ranges::find_if(groups, [&](Group const& g) {
            return g.name == u.name && g.is_attribute == is_attribute;
        });
        if (it == groups.end()) {
            groups.push_back(
                {.name = u.name, .is_attribute = is_attribute, .lines = {}});
            it = groups.end() - 1;
        }

        it->lines.push_back(ctx.line_of(u.node));
    }

    for (auto& g : groups) {
        auto message =
            g.is_attribute
                ? fmt::format("attribute '{}' is not defined by its class",
                              g.name)
                : fmt::format("name '{}' is not defined", g.name);
        report.add_error(FindingKind::UnresolvedReference, std::move(message),
                         std::move(g.lines));
    }
}

}  // namespace fuse
