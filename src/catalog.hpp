#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ast.hpp"
#include "catalog-id.hpp"
#include "file-store.hpp"
#include "macros.hpp"

namespace fuse {

enum class ScopeKind : uint8_t { Module, Class, Function, Comprehension };

enum class SymbolKind : uint8_t { Function, Class, Variable, Import, Parameter };

enum class UnitKind : uint8_t {
    /// `def`, `class` and assignments of values that do not call anything.
    Definition,
    /// A method of a top-level class. Rendered inside of its class.
    Method,
    /// `import` and `from ... import` at the top-level.
    Import,
    /// `try: import x` with an `except ImportError` fallback.
    GuardedImport,
    /// `if __name__ == "__main__":`
    EntryBlock,
    /// A string as the first statement of a module.
    Docstring,
    /// Anything else, executed when the module is imported.
    Statement,
};

/// One branch taken on the way to a binding: the `If` or `Try` node and the
/// index of the branch. Two bindings with a common node but different
/// indexes can never both run.
struct Branch {
    ast::NodeId node;
    uint32_t    index;

    constexpr auto operator==(Branch const& o) const -> bool = default;
};

struct Binding {
    // the node that introduces the name: a `Name`, `Param` or `ImportAlias`
    ast::NodeId node;
    // the construct that binds it, `FunctionDef` for functions, `ImportAlias`
    // for imports, or the same as `node`
    ast::NodeId         def;
    SymbolKind          kind;
    UnitId              unit;
    std::vector<Branch> branches;
};

/// One definition of a name in a scope. Rebinding the name adds to
/// `bindings`, the first binding is the defining one.
struct Symbol {
    std::string_view name;
    SymbolKind       kind;
    ScopeId          scope;
    uint32_t         module;

    std::vector<Binding> bindings;

    /// Set once by the conflict resolver when the name needs to change.
    std::string qualified_name;

    [[nodiscard]] auto def() const -> ast::NodeId {
        return bindings.front().def;
    }

    [[nodiscard]] auto name_node() const -> ast::NodeId {
        return bindings.front().node;
    }

    [[nodiscard]] auto unit() const -> UnitId { return bindings.front().unit; }

    [[nodiscard]] auto emitted_name() const -> std::string_view {
        return qualified_name.empty() ? name : qualified_name;
    }
};

struct Scope {
    ScopeKind   kind;
    ScopeId     parent;
    ast::NodeId node;
    uint32_t    module;

    std::vector<ScopeId>                           children;
    std::vector<SymbolId>                          symbols;
    std::unordered_map<std::string_view, SymbolId> names;

    std::unordered_set<std::string_view> globals;
    std::unordered_set<std::string_view> nonlocals;

    // classes only, names assigned through the first parameter of methods and
    // annotated names without a value
    std::unordered_set<std::string_view> instance_attrs;

    [[nodiscard]] auto find(std::string_view name) const -> SymbolId {
        if (auto it = names.find(name); it != names.end()) return it->second;
        return SymbolId::invalid();
    }
};

/// A top-level statement (or a method of a top-level class). This is the
/// granularity of selection, ordering and emission.
struct Unit {
    UnitKind    kind;
    uint32_t    module;
    ast::NodeId node;

    // the class of a method
    UnitId owner;

    // module-level symbols first bound by this unit
    std::vector<SymbolId> defines;
    std::vector<UnitId>   methods;

    // every `Name` in the unit. Eager names are evaluated when the unit runs,
    // lazy ones only when a function defined by it is called, and weak ones
    // are in string annotations.
    std::vector<ast::NodeId> eager_refs;
    std::vector<ast::NodeId> lazy_refs;
    std::vector<ast::NodeId> weak_refs;

    // `Import` and `ImportFrom` nodes anywhere in the unit
    std::vector<ast::NodeId> imports;

    [[nodiscard]] constexpr auto is_definition() const -> bool {
        return kind == UnitKind::Definition || kind == UnitKind::Method;
    }
};

/// A name that was bound twice in the same scope.
struct Duplicate {
    SymbolId    symbol;
    ast::NodeId first;
    ast::NodeId second;
};

/// Everything the catalog knows about one module.
struct ModuleTable {
    FileId      fileid;
    ast::NodeId root;
    ScopeId     scope;
    bool        is_entry;

    std::vector<UnitId>      units;
    std::vector<ast::NodeId> names;
    std::vector<ast::NodeId> attributes;
    std::vector<ast::NodeId> imports;

    // `nonlocal` names without a binding in an enclosing function
    std::vector<ast::NodeId> undeclared;
};

/// Scope tree and symbol tables of any number of modules, all parsed into the
/// same `Ast`. Built with one traversal per module.
class Catalog {
public:
    explicit Catalog(ast::Ast const& ast) : ast{&ast} {}

    /// Build the scopes, symbols and units of the module rooted at `root`.
    /// Returns the index of the module.
    auto add_module(ast::NodeId root, FileId fileid, bool is_entry)
        -> uint32_t;

    [[nodiscard]] auto get_scope(ScopeId id) const -> Scope const& {
        return scopes.at(id.value());
    }

    [[nodiscard]] auto get_symbol(SymbolId id) const -> Symbol const& {
        return symbols.at(id.value());
    }

    [[nodiscard]] auto get_unit(UnitId id) const -> Unit const& {
        return units.at(id.value());
    }

    [[nodiscard]] auto get_module(uint32_t idx) const -> ModuleTable const& {
        return modules.at(idx);
    }

    [[nodiscard]] auto module_count() const -> uint32_t {
        return static_cast<uint32_t>(modules.size());
    }

    [[nodiscard]] auto symbol_count() const -> uint32_t {
        return static_cast<uint32_t>(symbols.size());
    }

    [[nodiscard]] auto unit_count() const -> uint32_t {
        return static_cast<uint32_t>(units.size());
    }

    /// The scope a node is evaluated in. Names that are the first iterable
    /// of a comprehension belong to the enclosing scope.
    [[nodiscard]] auto scope_of(ast::NodeId node) const -> ScopeId;

    /// The unit that contains a node.
    [[nodiscard]] auto unit_of(ast::NodeId node) const -> UnitId;

    /// The symbol a binding node (target `Name`, function name, `Param` or
    /// `ImportAlias`) binds. Invalid for anything else.
    [[nodiscard]] auto symbol_bound_by(ast::NodeId node) const -> SymbolId;

    /// The symbols defined by the class whose body is `scope`, members of
    /// its bases not included.
    [[nodiscard]] auto class_scope_of(SymbolId cls) const -> ScopeId;

    [[nodiscard]] auto get_duplicates() const -> std::span<Duplicate const> {
        return duplicates;
    }

    [[nodiscard]] auto get_ast() const -> ast::Ast const& { return *ast; }

    /// Attach the qualified name computed by the conflict resolver. This may
    /// only be done once per symbol.
    void set_qualified_name(SymbolId id, std::string name);

private:
    struct Builder;
    friend struct Builder;

    ast::Ast const* ast;

    std::vector<Scope>       scopes;
    std::vector<Symbol>      symbols;
    std::vector<Unit>        units;
    std::vector<ModuleTable> modules;
    std::vector<Duplicate>   duplicates;

    // side tables indexed by node
    std::vector<ScopeId>  node_scope;
    std::vector<UnitId>   node_unit;
    std::vector<SymbolId> node_binding;

    // class symbol -> class body scope
    std::unordered_map<SymbolId, ScopeId> class_scopes;
};

/// Is the statement `if __name__ == "__main__":`.
[[nodiscard]] auto is_entry_block(ast::Ast const& ast, ast::NodeId stmt)
    -> bool;

auto format_as(ScopeKind kind) -> std::string_view;
auto format_as(SymbolKind kind) -> std::string_view;
auto format_as(UnitKind kind) -> std::string_view;

void to_json(nlohmann::json& j, Symbol const& s);

}  // namespace fuse

define_formatter_from_string_view(fuse::ScopeKind);
define_formatter_from_string_view(fuse::SymbolKind);
define_formatter_from_string_view(fuse::UnitKind);
