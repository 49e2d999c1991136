#include "resolver.hpp"

#include <string_view>
#include <unordered_set>
#include <utility>

#include "builtins.hpp"
#include "utils.hpp"

namespace fuse {
using ast::NodeId;
using ast::NodeKind;

namespace {

// bases deeper than this are treated as unknown
constexpr uint32_t MAX_BASE_DEPTH = 32;

auto is_dataclass_decorator(ast::Ast const& ast, NodeId deco) -> bool {
    auto const& node = ast.get(deco);
    switch (node.kind) {
        case NodeKind::Name: return node.str == "dataclass";
        case NodeKind::Attribute: return node.str == "dataclass";
        case NodeKind::Call:
            return is_dataclass_decorator(ast, ast.child(deco, 0));
        default: return false;
    }
}

}  // namespace

Resolver::Resolver(ast::Ast const& ast, Catalog const& catalog,
                   FollowFn follow)
    : ast{&ast},
      catalog{&catalog},
      follow{std::move(follow)},
      resolved(ast.size(), SymbolId::invalid()) {}

void Resolver::resolve() {
    for (uint32_t m = 0; m < catalog->module_count(); m++) resolve_module(m);
}

void Resolver::resolve_module(uint32_t module) {
    auto const& table = catalog->get_module(module);

    std::unordered_set<NodeId> undeclared{table.undeclared.begin(),
                                          table.undeclared.end()};

    for (auto name : table.names) {
        auto const& node = ast->get(name);
        if (undeclared.contains(name)) {
            unresolved.push_back({.node = name, .name = node.str});
            continue;
        }

        auto sym = catalog->symbol_bound_by(name);
        if (sym.is_invalid()) sym = lookup(catalog->scope_of(name), node.str);

        if (sym.is_valid()) {
            resolved.at(name.value()) = sym;
            continue;
        }

        // `name: int` declares without binding
        if (node.is_store() || is_builtin(node.str)) continue;
        unresolved.push_back({.node = name, .name = node.str});
    }
}

auto Resolver::lookup(ScopeId scope, std::string_view name) const
    -> SymbolId {
    auto first = true;
    for (auto id = scope; id.is_valid();) {
        auto const& s = catalog->get_scope(id);

        if (s.globals.contains(name)) {
            auto const& m = catalog->get_module(s.module);
            return catalog->get_scope(m.scope).find(name);
        }

        // class bodies are not visible from the functions nested in them
        auto visible = first || s.kind != ScopeKind::Class;
        if (visible && !s.nonlocals.contains(name)) {
            if (auto sym = s.find(name); sym.is_valid()) return sym;
        }

        first = false;
        id = s.parent;
    }

    return SymbolId::invalid();
}

auto Resolver::symbol_of(NodeId name) const -> SymbolId {
    if (name.is_invalid() || name.value() >= resolved.size())
        return SymbolId::invalid();
    return resolved[name.value()];
}

auto Resolver::follow_symbol(SymbolId id) const -> SymbolId {
    if (id.is_invalid()) return id;
    if (catalog->get_symbol(id).kind != SymbolKind::Import) return id;
    if (!follow) return SymbolId::invalid();

    return follow(id);
}

// ============================================================================

auto Resolver::class_of_symbol(SymbolId id) const -> ScopeId {
    id = follow_symbol(id);
    if (id.is_invalid()) return ScopeId::invalid();

    auto const& sym = catalog->get_symbol(id);
    if (sym.kind == SymbolKind::Class) return catalog->class_scope_of(id);
    if (sym.kind != SymbolKind::Variable || sym.bindings.size() != 1)
        return ScopeId::invalid();

    // `x = Class(...)`
    auto target = sym.def();
    auto parent = ast->parent(target);
    if (parent.is_invalid()) return ScopeId::invalid();

    NodeId value;
    switch (ast->kind_of(parent)) {
        case NodeKind::Assign: value = ast->children(parent).back(); break;
        case NodeKind::AnnAssign: value = ast->child(parent, 2); break;
        default: return ScopeId::invalid();
    }

    if (value.is_invalid() || value == target ||
        ast->kind_of(value) != NodeKind::Call)
        return ScopeId::invalid();

    return class_named(ast->child(value, 0));
}

auto Resolver::class_named(NodeId expr) const -> ScopeId {
    auto const& node = ast->get(expr);
    if (node.kind == NodeKind::Name) {
        auto sym = follow_symbol(symbol_of(expr));
        if (sym.is_valid() && catalog->get_symbol(sym).kind == SymbolKind::Class)
            return catalog->class_scope_of(sym);
        return ScopeId::invalid();
    }

    if (node.kind == NodeKind::Attribute) {
        auto outer = class_named(ast->child(expr, 0));
        if (outer.is_invalid()) return ScopeId::invalid();

        auto member = catalog->get_scope(outer).find(node.str);
        if (member.is_valid() &&
            catalog->get_symbol(member).kind == SymbolKind::Class)
            return catalog->class_scope_of(member);
    }

    return ScopeId::invalid();
}

auto Resolver::class_of(NodeId expr) const -> ScopeId {
    auto const& node = ast->get(expr);
    switch (node.kind) {
        case NodeKind::Name: return class_of_symbol(symbol_of(expr));

        case NodeKind::Attribute: {
            auto outer = class_of(ast->child(expr, 0));
            if (outer.is_invalid()) return ScopeId::invalid();

            // only nested classes are followed
            auto member = catalog->get_scope(outer).find(node.str);
            if (member.is_invalid() ||
                catalog->get_symbol(member).kind != SymbolKind::Class)
                return ScopeId::invalid();

            return catalog->class_scope_of(member);
        }

        default: return ScopeId::invalid();
    }
}

auto Resolver::accepts_any_attribute(ScopeId cls, uint32_t depth) const
    -> bool {
    if (depth > MAX_BASE_DEPTH) return true;

    auto const& scope = catalog->get_scope(cls);
    if (scope.find("__getattr__").is_valid() ||
        scope.find("__getattribute__").is_valid())
        return true;

    // decorators may return anything
    for (auto deco : ast->children(ast->child(scope.node, 1))) {
        if (!is_dataclass_decorator(*ast, deco)) return true;
    }

    for (auto base : ast->children(ast->child(scope.node, 2))) {
        auto const& node = ast->get(base);
        switch (node.kind) {
            case NodeKind::Keyword:
                if (node.str == "metaclass") return true;
                continue;
            case NodeKind::Name:
                if (symbol_of(base).is_invalid()) {
                    if (node.str == "object") continue;
                    return true;
                }
                break;
            case NodeKind::Attribute: break;
            default: return true;
        }

        auto base_cls = class_of(base);
        if (base_cls.is_invalid() || base_cls == cls) return true;
        if (accepts_any_attribute(base_cls, depth + 1)) return true;
    }

    return false;
}

auto Resolver::has_member(ScopeId cls, std::string_view name,
                          uint32_t depth) const -> bool {
    if (depth > MAX_BASE_DEPTH) return true;

    auto const& scope = catalog->get_scope(cls);
    if (scope.find(name).is_valid()) return true;
    if (scope.instance_attrs.contains(name)) return true;

    if (auto it = extra.find(cls); it != extra.end()) {
        if (it->second.contains(name)) return true;
    }

    for (auto base : ast->children(ast->child(scope.node, 2))) {
        if (ast->kind_of(base) == NodeKind::Keyword) continue;

        auto base_cls = class_of(base);
        if (base_cls.is_valid() && has_member(base_cls, name, depth + 1))
            return true;
    }

    return false;
}

void Resolver::validate_attributes() {
    // stores from outside of a class add members to it
    for (uint32_t m = 0; m < catalog->module_count(); m++) {
        for (auto attr : catalog->get_module(m).attributes) {
            auto const& node = ast->get(attr);
            if (!node.is_store()) continue;

            auto cls = class_of(ast->child(attr, 0));
            if (cls.is_valid()) extra[cls].insert(node.str);
        }
    }

    for (uint32_t m = 0; m < catalog->module_count(); m++) {
        for (auto attr : catalog->get_module(m).attributes) {
            auto const& node = ast->get(attr);
            if (node.is_store() || is_dunder(node.str)) continue;

            auto cls = class_of(ast->child(attr, 0));
            if (cls.is_invalid()) continue;
            if (accepts_any_attribute(cls) || has_member(cls, node.str))
                continue;

            unresolved.push_back({.node = attr, .name = node.str});
        }
    }
}

}  // namespace fuse
