#include "project.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "fmt/format.h"
#include "fmt/ranges.h"
#include "libassert/assert.hpp"
#include "parser.hpp"

namespace fuse {
using ast::NodeId;
using ast::NodeKind;

namespace fs = std::filesystem;

namespace {

auto first_segment(std::string_view dotted) -> std::string_view {
    return dotted.substr(0, dotted.find('.'));
}

auto parent_package(std::string_view name) -> std::string_view {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos) return {};
    return name.substr(0, dot);
}

auto join_module(std::string_view base, std::string_view name) -> std::string {
    if (base.empty()) return std::string{name};
    if (name.empty()) return std::string{base};
    return fmt::format("{}.{}", base, name);
}

// `pkg/sub/mod.py` to `pkg.sub.mod`, `pkg/__init__.py` to `pkg`
auto module_name_of(fs::path relpath) -> std::pair<std::string, bool> {
    relpath.replace_extension();

    std::vector<std::string> parts;
    for (auto const& part : relpath) parts.push_back(part.string());

    auto is_package = !parts.empty() && parts.back() == "__init__";
    if (is_package) parts.pop_back();

    return {fmt::format("{}", fmt::join(parts, ".")), is_package};
}

}  // namespace

Project::Project(FileStore& fs, fs::path root, FILE* trace)
    : fs{&fs},
      root{fs::absolute(root).lexically_normal()},
      trace{trace},
      catalog{ast} {}

void Project::load(fs::path const& entry_path) {
    auto path = fs::absolute(entry_path).lexically_normal();
    entry_dir = path.parent_path();

    auto relpath = path.lexically_relative(root);
    if (relpath.empty() || *relpath.begin() == "..") relpath = path.filename();

    auto [name, is_package] = module_name_of(relpath);
    entry = load_module(std::move(name), path, relpath.generic_string(),
                        is_package, true);
}

auto Project::load_module(std::string name, fs::path const& path,
                          std::string relpath, bool is_package, bool is_entry)
    -> uint32_t {
    auto fileid = fs->add_file(path.string());
    if (fileid.is_invalid()) {
        throw std::runtime_error{
            fmt::format("failed to read file: {}", path.string())};
    }

    auto file = fs->get_file_by_id(fileid);
    ASSERT(file.has_value());

    auto root_node = parse_source(file->contents, fileid, ast);
    auto idx = catalog.add_module(root_node, fileid, is_entry);
    ASSERT(idx == modules.size());

    if (trace) {
        fmt::print(trace, "load: {} from {}{} [{} files, {}B]\n", name,
                   relpath, is_entry ? " (entry)" : "", fs->size(),
                   fs->bytes_used());
    }

    by_name.emplace(name, idx);
    modules.push_back({
        .index = idx,
        .name = std::move(name),
        .relpath = std::move(relpath),
        .fileid = fileid,
        .root = root_node,
        .is_package = is_package,
        .is_entry = is_entry,
    });

    load_imports(idx);
    load_order.push_back(idx);

    return idx;
}

void Project::load_imports(uint32_t module) {
    // copied, loading other modules grows the catalog
    auto imports = catalog.get_module(module).imports;

    auto load_prefixes = [&](std::string_view dotted) {
        for (size_t dot = dotted.find('.'); dot != std::string_view::npos;
             dot = dotted.find('.', dot + 1)) {
            load_by_name(dotted.substr(0, dot));
        }

        load_by_name(dotted);
    };

    for (auto stmt : imports) {
        auto const& node = ast.get(stmt);
        if (node.kind == NodeKind::Import) {
            for (auto alias : ast.children(stmt))
                load_prefixes(ast.get(alias).str);
            continue;
        }

        auto base = absolute_module(module, stmt);
        if (base.empty()) continue;

        load_prefixes(base);
        for (auto alias : ast.children(stmt)) {
            auto str = ast.get(alias).str;
            if (str != "*") load_by_name(join_module(base, str));
        }
    }
}

void Project::load_by_name(std::string_view name) {
    if (by_name.contains(std::string{name})) return;

    auto found = search(name);
    if (!found) return;

    auto path = found->path;
    auto relpath = found->relpath;
    (void)load_module(std::string{name}, path, std::move(relpath),
                      found->is_package, false);
}

auto Project::search(std::string_view name) const -> std::optional<Found> {
    auto key = std::string{name};
    if (auto it = searched.find(key); it != searched.end()) return it->second;

    fs::path rel;
    for (size_t start = 0;;) {
        auto dot = name.find('.', start);
        rel /= std::string{name.substr(start, dot - start)};
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }

    std::optional<Found> found;
    for (auto const& dir : {root, entry_dir}) {
        if (dir.empty()) continue;

        auto file = rel;
        file += ".py";
        if (fs::is_regular_file(dir / file)) {
            found = Found{.path = dir / file,
                          .relpath = file.generic_string(),
                          .is_package = false};
            break;
        }

        auto init = rel / "__init__.py";
        if (fs::is_regular_file(dir / init)) {
            found = Found{.path = dir / init,
                          .relpath = init.generic_string(),
                          .is_package = true};
            break;
        }
    }

    searched.emplace(std::move(key), found);
    return found;
}

// Loaded modules, and namespace packages that contain loaded modules.
auto Project::is_internal(std::string_view name) const -> bool {
    if (name.empty()) return false;
    if (find_module(name)) return true;

    auto prefix = fmt::format("{}.", name);
    return std::ranges::any_of(
        modules, [&](Module const& m) { return m.name.starts_with(prefix); });
}

auto Project::find_module(std::string_view name) const
    -> std::optional<uint32_t> {
    if (auto it = by_name.find(std::string{name}); it != by_name.end())
        return it->second;
    return std::nullopt;
}

auto Project::absolute_module(uint32_t module, NodeId import_from) const
    -> std::string {
    auto const& node = ast.get(import_from);
    auto        level = node.get_level();
    if (level == 0) return std::string{node.str};

    auto const&      m = modules.at(module);
    std::string_view package = m.name;
    if (!m.is_package) package = parent_package(package);

    for (uint32_t i = 1; i < level; i++) {
        if (package.empty()) return {};
        package = parent_package(package);
    }

    if (package.empty()) return {};
    return join_module(package, node.str);
}

auto Project::module_of_node(NodeId node) const -> uint32_t {
    if (auto scope = catalog.scope_of(node); scope.is_valid())
        return catalog.get_scope(scope).module;

    auto top = node;
    while (ast.parent(top).is_valid()) top = ast.parent(top);

    for (auto const& m : modules)
        if (m.root == top) return m.index;

    UNREACHABLE("node is not part of any module", node);
}

auto Project::location_of(NodeId node) const -> Location {
    return {.fileid = modules.at(module_of_node(node)).fileid,
            .span = ast.get(node).span};
}

auto Project::is_internal_alias(NodeId alias) const -> bool {
    auto        stmt = ast.parent(alias);
    auto const& node = ast.get(alias);

    if (ast.kind_of(stmt) == NodeKind::Import) {
        auto has_asname = ast.child(alias, 0).is_valid();
        return is_internal(has_asname ? node.str : first_segment(node.str));
    }

    return is_internal(absolute_module(module_of_node(stmt), stmt));
}

// ============================================================================

void Project::link() {
    resolver.emplace(ast, catalog, [this](SymbolId id) {
        auto const& target = alias_target(id);
        return target.kind == TargetKind::Symbol ? target.symbol
                                                 : SymbolId::invalid();
    });

    check_wildcards();
    check_duplicates();

    resolver->resolve();
    check_unresolved();

    link_references();
    check_dynamic_imports();

    resolver->validate_attributes();
    check_unresolved();
}

void Project::check_wildcards() {
    for (auto const& m : modules) {
        for (auto stmt : catalog.get_module(m.index).imports) {
            auto const& node = ast.get(stmt);
            if (node.kind != NodeKind::ImportFrom) continue;

            for (auto alias : ast.children(stmt)) {
                if (ast.get(alias).str != "*") continue;

                throw UnsupportedConstructError{
                    fmt::format("wildcard import from '{}{}' is not supported",
                                std::string(node.get_level(), '.'), node.str),
                    location_of(stmt)};
            }
        }
    }
}

void Project::check_duplicates() {
    auto dups = catalog.get_duplicates();
    if (dups.empty()) return;

    auto const& d = dups.front();
    auto const& sym = catalog.get_symbol(d.symbol);
    throw DuplicateDefinitionError{
        fmt::format("'{}' is defined more than once in the same scope",
                    sym.name),
        {location_of(d.second), location_of(d.first)}};
}

void Project::check_unresolved() {
    auto unresolved = resolver->get_unresolved();
    if (unresolved.empty()) return;

    std::vector<std::string_view> names;
    std::vector<Location>         locations;
    for (auto const& u : unresolved) {
        if (std::ranges::find(names, u.name) == names.end())
            names.push_back(u.name);
        locations.push_back(location_of(u.node));
    }

    throw UnresolvedReferenceError{
        fmt::format("unresolved reference{} to '{}'",
                    names.size() == 1 ? "" : "s", fmt::join(names, "', '")),
        std::move(locations)};
}

void Project::check_dynamic_imports() {
    auto is_dynamic_import = [](std::string_view name) {
        return name == "import_module" || name == "__import__";
    };

    auto alias_of = [&](NodeId name) -> NodeId {
        auto sym = resolver->symbol_of(name);
        if (sym.is_invalid()) return NodeId::invalid();

        auto const& s = catalog.get_symbol(sym);
        if (s.kind != SymbolKind::Import) return NodeId::invalid();
        return s.def();
    };

    for (auto const& m : modules) {
        auto const& table = catalog.get_module(m.index);

        for (auto name : table.names) {
            auto const& node = ast.get(name);
            if (node.is_store()) continue;

            auto fail = [&] {
                throw UnsupportedConstructError{
                    fmt::format("dynamic import with '{}' is not supported",
                                node.str),
                    location_of(name)};
            };

            if (node.str == "__import__" &&
                resolver->symbol_of(name).is_invalid())
                fail();

            // `from importlib import import_module`
            auto alias = alias_of(name);
            if (alias.is_invalid()) continue;

            auto stmt = ast.parent(alias);
            if (ast.kind_of(stmt) == NodeKind::ImportFrom &&
                absolute_module(m.index, stmt) == "importlib" &&
                is_dynamic_import(ast.get(alias).str) &&
                catalog.symbol_bound_by(name).is_invalid())
                fail();
        }

        // `importlib.import_module(...)`
        for (auto attr : table.attributes) {
            auto const& node = ast.get(attr);
            if (!is_dynamic_import(node.str)) continue;

            auto value = ast.child(attr, 0);
            if (ast.kind_of(value) != NodeKind::Name) continue;

            auto alias = alias_of(value);
            if (alias.is_invalid()) continue;
            if (ast.kind_of(ast.parent(alias)) != NodeKind::Import) continue;
            if (ast.get(alias).str != "importlib") continue;

            throw UnsupportedConstructError{
                fmt::format("dynamic import with 'importlib.{}' is not "
                            "supported",
                            node.str),
                location_of(attr)};
        }
    }
}

void Project::link_references() {
    ref_targets.resize(ast.size(), {.symbol = SymbolId::invalid(),
                                    .node = NodeId::invalid()});

    for (auto const& m : modules) {
        for (auto name : catalog.get_module(m.index).names) {
            auto sym = resolver->symbol_of(name);
            if (sym.is_invalid()) continue;

            auto const& s = catalog.get_symbol(sym);
            if (s.kind != SymbolKind::Import ||
                catalog.symbol_bound_by(name) == sym) {
                ref_targets.at(name.value()) = {.symbol = sym, .node = name};
                continue;
            }

            auto target = alias_target(sym);
            auto outer = name;
            while (target.kind == TargetKind::Module) {
                auto parent = ast.parent(outer);
                if (parent.is_invalid() ||
                    ast.kind_of(parent) != NodeKind::Attribute ||
                    ast.child(parent, 0) != outer) {
                    throw UnsupportedConstructError{
                        fmt::format("module '{}' can not be used as a value",
                                    target.module),
                        location_of(outer)};
                }

                target =
                    member_of(target.module, ast.get(parent).str, parent);
                outer = parent;
            }

            auto is_load = ast.get(outer).get_ctx() == ast::ExprContext::Load;
            auto in_module = catalog.get_scope(catalog.scope_of(name)).kind ==
                             ScopeKind::Module;
            if (outer != name && !is_load && !in_module) {
                throw UnsupportedConstructError{
                    "assignment to a module attribute inside of a function is "
                    "not supported",
                    location_of(outer)};
            }

            auto resolved = target.symbol.is_valid() ? target.symbol : sym;
            ref_targets.at(name.value()) = {.symbol = resolved, .node = outer};
        }
    }
}

auto Project::ref_target(NodeId name) const -> RefTarget {
    if (name.is_invalid() || name.value() >= ref_targets.size())
        return {.symbol = SymbolId::invalid(), .node = NodeId::invalid()};
    return ref_targets[name.value()];
}

auto Project::alias_target(SymbolId alias) -> ImportTarget const& {
    if (auto it = alias_targets.find(alias); it != alias_targets.end())
        return it->second;

    auto const& sym = catalog.get_symbol(alias);
    if (std::ranges::find(following, alias) != following.end()) {
        throw UnresolvedReferenceError{
            fmt::format("import of '{}' refers back to itself", sym.name),
            {location_of(sym.def())}};
    }

    following.push_back(alias);
    auto target = compute_alias_target(alias);
    following.pop_back();

    return alias_targets.emplace(alias, std::move(target)).first->second;
}

auto Project::compute_alias_target(SymbolId alias) -> ImportTarget {
    auto const& sym = catalog.get_symbol(alias);
    auto        def = sym.def();
    auto        stmt = ast.parent(def);
    auto const& node = ast.get(def);

    if (ast.kind_of(stmt) == NodeKind::Import) {
        auto dotted = std::string{ast.child(def, 0).is_valid()
                                      ? node.str
                                      : first_segment(node.str)};
        if (is_internal(dotted)) {
            return {.kind = TargetKind::Module,
                    .module = std::move(dotted),
                    .symbol = {}};
        }

        return {.kind = TargetKind::External,
                .module = std::move(dotted),
                .symbol = alias};
    }

    auto const& from = ast.get(stmt);
    auto        base = absolute_module(sym.module, stmt);
    if (from.get_level() > 0 && !is_internal(base)) {
        throw UnresolvedReferenceError{
            fmt::format("relative import '{}{}' does not name a module of the "
                        "project",
                        std::string(from.get_level(), '.'), from.str),
            {location_of(stmt)}};
    }

    if (!is_internal(base)) {
        return {.kind = TargetKind::External,
                .module = std::move(base),
                .symbol = alias};
    }

    return member_of(base, node.str, def);
}

auto Project::member_of(std::string const& module, std::string_view name,
                        NodeId use) -> ImportTarget {
    if (auto idx = find_module(module)) {
        auto const& scope = catalog.get_scope(catalog.get_module(*idx).scope);
        if (auto sym = scope.find(name); sym.is_valid()) {
            if (catalog.get_symbol(sym).kind == SymbolKind::Import)
                return alias_target(sym);

            return {.kind = TargetKind::Symbol, .module = {}, .symbol = sym};
        }
    }

    auto sub = join_module(module, name);
    if (is_internal(sub))
        return {.kind = TargetKind::Module, .module = sub, .symbol = {}};

    throw UnresolvedReferenceError{
        fmt::format("module '{}' has no attribute '{}'", module, name),
        {location_of(use)}};
}

}  // namespace fuse
