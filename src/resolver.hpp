#pragma once

#include <functional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ast.hpp"
#include "catalog.hpp"

namespace fuse {

/// A use of a name (or of an attribute of a local class) that denotes
/// nothing.
struct Unresolved {
    ast::NodeId      node;
    std::string_view name;
};

/// Resolves every name use of the modules of a `Catalog` to the symbol it
/// denotes, following the scope chain, and validates attribute chains that
/// start at local classes.
class Resolver {
public:
    /// Maps an import alias to the symbol it finally denotes. Returns an
    /// invalid id for externals and modules.
    using FollowFn = std::function<SymbolId(SymbolId)>;

    Resolver(ast::Ast const& ast, Catalog const& catalog,
             FollowFn follow = {});

    /// Resolve every name of every module in the catalog.
    void resolve();

    /// Check the attributes of local classes. Needs `resolve()`.
    void validate_attributes();

    /// The symbol a `Name` node denotes, after `resolve()`. Invalid for
    /// builtins and unresolved names.
    [[nodiscard]] auto symbol_of(ast::NodeId name) const -> SymbolId;

    /// Find what `name` denotes when used in `scope`.
    [[nodiscard]] auto lookup(ScopeId scope, std::string_view name) const
        -> SymbolId;

    /// The scope of the local class denoted by an expression, either the
    /// class itself or an instance created by calling it.
    [[nodiscard]] auto class_of(ast::NodeId expr) const -> ScopeId;

    [[nodiscard]] auto get_unresolved() const -> std::span<Unresolved const> {
        return unresolved;
    }

private:
    void resolve_module(uint32_t module);

    [[nodiscard]] auto follow_symbol(SymbolId id) const -> SymbolId;
    [[nodiscard]] auto class_of_symbol(SymbolId id) const -> ScopeId;
    [[nodiscard]] auto class_named(ast::NodeId expr) const -> ScopeId;

    [[nodiscard]] auto has_member(ScopeId cls, std::string_view name,
                                  uint32_t depth = 0) const -> bool;
    [[nodiscard]] auto accepts_any_attribute(ScopeId cls,
                                             uint32_t depth = 0) const -> bool;

    ast::Ast const* ast;
    Catalog const*  catalog;
    FollowFn        follow;

    std::vector<SymbolId>   resolved;
    std::vector<Unresolved> unresolved;

    // members added by assigning to attributes of a class from outside of it
    std::unordered_map<ScopeId, std::unordered_set<std::string_view>> extra;
};

}  // namespace fuse
