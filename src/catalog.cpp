#include "catalog.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "fmt/format.h"
#include "libassert/assert.hpp"
#include "nlohmann/json.hpp"

namespace fuse {
using ast::NodeId;
using ast::NodeKind;

namespace {

auto first_segment(std::string_view dotted) -> std::string_view {
    return dotted.substr(0, dotted.find('.'));
}

// `except ImportError:`, `except (ImportError, ModuleNotFoundError):`
auto catches_import_error(ast::Ast const& ast, NodeId handler) -> bool {
    auto type = ast.child(handler, 0);
    if (type.is_invalid()) return false;

    auto is_import_error = [&](NodeId n) {
        auto const& node = ast.get(n);
        return node.kind == NodeKind::Name &&
               (node.str == "ImportError" || node.str == "ModuleNotFoundError");
    };

    if (ast.kind_of(type) == NodeKind::Tuple) {
        for (auto elt : ast.children(type))
            if (is_import_error(elt)) return true;
        return false;
    }

    return is_import_error(type);
}

auto is_guarded_try(ast::Ast const& ast, NodeId id) -> bool {
    auto ch = ast.children(id);
    for (size_t i = 3; i < ch.size(); i++)
        if (catches_import_error(ast, ch[i])) return true;
    return false;
}

// Does evaluating the expression call into user code. Lambda bodies are not
// evaluated.
auto may_call(ast::Ast const& ast, NodeId id) -> bool {
    if (id.is_invalid()) return false;

    auto const& node = ast.get(id);
    switch (node.kind) {
        case NodeKind::Call:
        case NodeKind::Await:
        case NodeKind::Yield:
        case NodeKind::YieldFrom:
        case NodeKind::NamedExpr: return true;
        case NodeKind::Lambda: {
            for (auto param : ast.children(ast.child(id, 0)))
                if (may_call(ast, ast.child(param, 1))) return true;
            return false;
        }
        default: break;
    }

    for (auto child : ast.children(id))
        if (may_call(ast, child)) return true;

    return false;
}

// collect the names bound by a plain target, fails on anything else
auto collect_plain_targets(ast::Ast const& ast, NodeId target,
                           std::vector<std::string_view>& out) -> bool {
    auto const& node = ast.get(target);
    switch (node.kind) {
        case NodeKind::Name: out.push_back(node.str); return true;
        case NodeKind::Tuple:
        case NodeKind::List:
            for (auto elt : ast.children(target))
                if (!collect_plain_targets(ast, elt, out)) return false;
            return true;
        default: return false;
    }
}

auto is_docstring(ast::Ast const& ast, NodeId stmt) -> bool {
    if (ast.kind_of(stmt) != NodeKind::ExprStmt) return false;

    auto const& value = ast.get(ast.child(stmt, 0));
    return value.kind == NodeKind::Str && (value.flags & ast::STR_FSTRING) == 0;
}

auto is_guarded_import_body(ast::Ast const& ast, NodeId block) -> bool {
    for (auto stmt : ast.children(block)) {
        switch (ast.kind_of(stmt)) {
            case NodeKind::Import:
            case NodeKind::ImportFrom:
            case NodeKind::Pass: break;
            case NodeKind::Assign:
                if (may_call(ast, ast.children(stmt).back())) return false;
                break;
            case NodeKind::AnnAssign:
                if (may_call(ast, ast.child(stmt, 2))) return false;
                break;
            default: return false;
        }
    }

    return true;
}

auto is_guarded_import(ast::Ast const& ast, NodeId stmt) -> bool {
    if (ast.kind_of(stmt) != NodeKind::Try) return false;
    if (!is_guarded_try(ast, stmt)) return false;

    auto ch = ast.children(stmt);
    if (ch[2].is_valid()) return false;

    auto has_import = false;
    for (auto s : ast.children(ch[0])) {
        if (ast.get(s).is_oneof(NodeKind::Import, NodeKind::ImportFrom))
            has_import = true;
    }
    if (!has_import) return false;

    if (!is_guarded_import_body(ast, ch[0])) return false;
    if (ch[1].is_valid() && !is_guarded_import_body(ast, ch[1])) return false;

    for (size_t i = 3; i < ch.size(); i++) {
        if (!is_guarded_import_body(ast, ast.children(ch[i]).back()))
            return false;
    }

    return true;
}

// A decorator like `@name.setter`, or `@overload`
auto is_accessor_or_overload(ast::Ast const& ast, NodeId def,
                             std::string_view name) -> bool {
    if (def.is_invalid() || ast.kind_of(def) != NodeKind::FunctionDef)
        return false;

    for (auto deco : ast.children(ast.child(def, 1))) {
        auto const& node = ast.get(deco);
        if (node.kind == NodeKind::Name && node.str == "overload") return true;
        if (node.kind != NodeKind::Attribute) continue;
        if (node.str == "overload") return true;

        auto const& value = ast.get(ast.child(deco, 0));
        if (value.kind == NodeKind::Name && value.str == name &&
            (node.str == "setter" || node.str == "getter" ||
             node.str == "deleter"))
            return true;
    }

    return false;
}

// `import a.b` and `import a` bind the same object to `a`.
auto same_import(ast::Ast const& ast, NodeId a, NodeId b) -> bool {
    auto key = [&](NodeId alias) -> std::pair<std::string, std::string> {
        auto const& stmt = ast.get(ast.parent(alias));
        auto const& node = ast.get(alias);
        auto has_asname = ast.child(alias, 0).is_valid();

        if (stmt.kind == NodeKind::Import) {
            return {"", std::string{has_asname ? node.str
                                               : first_segment(node.str)}};
        }

        return {fmt::format("{}{}", std::string(stmt.get_level(), '.'),
                            stmt.str),
                std::string{node.str}};
    };

    return key(a) == key(b);
}

auto are_alternatives(std::span<Branch const> a, std::span<Branch const> b)
    -> bool {
    for (auto const& ba : a) {
        for (auto const& bb : b) {
            if (ba.node == bb.node && ba.index != bb.index) return true;
        }
    }

    return false;
}

auto is_rebinding(SymbolKind kind) -> bool {
    return kind == SymbolKind::Variable || kind == SymbolKind::Parameter;
}

}  // namespace

auto is_entry_block(ast::Ast const& ast, NodeId stmt) -> bool {
    if (ast.kind_of(stmt) != NodeKind::If) return false;

    auto test = ast.child(stmt, 0);
    auto const& cmp = ast.get(test);
    if (cmp.kind != NodeKind::Compare || cmp.str != "==") return false;

    auto operands = ast.children(test);
    if (operands.size() != 2) return false;

    auto is_name = [&](NodeId n) {
        auto const& node = ast.get(n);
        return node.kind == NodeKind::Name && node.str == "__name__";
    };

    auto is_main_str = [&](NodeId n) {
        auto const& node = ast.get(n);
        return node.kind == NodeKind::Str && node.flags == 0 &&
               ast::string_literal_body(node.str) == "__main__";
    };

    return (is_name(operands[0]) && is_main_str(operands[1])) ||
           (is_main_str(operands[0]) && is_name(operands[1]));
}

// ============================================================================

struct Catalog::Builder {
    enum class Mode : uint8_t { Eager, Lazy, Weak };

    struct State {
        ScopeId             scope;
        UnitId              unit;
        Mode                mode;
        std::vector<Branch> branches;
        std::string_view    self_name;
        ScopeId             self_class;
    };

    // a binding of a `nonlocal` name, attached once the whole module is seen
    struct PendingBinding {
        ScopeId          scope;
        std::string_view name;
        Binding          binding;
    };

    Catalog&        c;
    ast::Ast const& ast;
    uint32_t        module;

    ScopeId scope;
    UnitId  unit;
    Mode    mode = Mode::Eager;

    std::vector<Branch> branches;

    // first parameter of the method being visited and its class
    std::string_view self_name;
    ScopeId          self_class;

    std::vector<PendingBinding>             pending;
    std::vector<std::pair<ScopeId, NodeId>> nonlocal_decls;

    [[nodiscard]] auto save() const -> State {
        return {
            .scope = scope,
            .unit = unit,
            .mode = mode,
            .branches = branches,
            .self_name = self_name,
            .self_class = self_class,
        };
    }

    void restore(State&& s) {
        scope = s.scope;
        unit = s.unit;
        mode = s.mode;
        branches = std::move(s.branches);
        self_name = s.self_name;
        self_class = s.self_class;
    }

    [[nodiscard]] auto table() -> ModuleTable& { return c.modules.at(module); }

    [[nodiscard]] auto module_scope() const -> ScopeId {
        return c.modules.at(module).scope;
    }

    [[nodiscard]] auto get_scope(ScopeId id) -> Scope& {
        return c.scopes.at(id.value());
    }

    [[nodiscard]] auto get_unit(UnitId id) -> Unit& {
        return c.units.at(id.value());
    }

    auto new_scope(ScopeKind kind, NodeId node) -> ScopeId {
        auto id = ScopeId::from_raw_data(static_cast<uint32_t>(c.scopes.size()));
        c.scopes.push_back({
            .kind = kind,
            .parent = scope,
            .node = node,
            .module = module,
            .children = {},
            .symbols = {},
            .names = {},
            .globals = {},
            .nonlocals = {},
            .instance_attrs = {},
        });

        if (scope.is_valid()) get_scope(scope).children.push_back(id);
        return id;
    }

    auto new_unit(UnitKind kind, NodeId node, UnitId owner) -> UnitId {
        auto id = UnitId::from_raw_data(static_cast<uint32_t>(c.units.size()));
        c.units.push_back({
            .kind = kind,
            .module = module,
            .node = node,
            .owner = owner,
            .defines = {},
            .methods = {},
            .eager_refs = {},
            .lazy_refs = {},
            .weak_refs = {},
            .imports = {},
        });

        if (owner.is_valid()) get_unit(owner).methods.push_back(id);
        return id;
    }

    void enter(NodeId id) {
        c.node_scope.at(id.value()) = scope;
        c.node_unit.at(id.value()) = unit;
    }

    // record a use (or binding) of a name in the current unit
    void record_name(NodeId id) {
        enter(id);
        table().names.push_back(id);

        auto& u = get_unit(unit);
        switch (mode) {
            case Mode::Eager: u.eager_refs.push_back(id); break;
            case Mode::Lazy: u.lazy_refs.push_back(id); break;
            case Mode::Weak: u.weak_refs.push_back(id); break;
        }
    }

    // ------------------------------------------------------------------------

    auto find_duplicate(Symbol const& sym, Binding const& b) const -> NodeId {
        for (auto const& e : sym.bindings) {
            if (is_rebinding(e.kind) && is_rebinding(b.kind)) continue;
            if (are_alternatives(e.branches, b.branches)) continue;
            if (is_accessor_or_overload(ast, e.def, sym.name) ||
                is_accessor_or_overload(ast, b.def, sym.name))
                continue;
            if (e.kind == SymbolKind::Import && b.kind == SymbolKind::Import &&
                same_import(ast, e.def, b.def))
                continue;

            return e.node;
        }

        return NodeId::invalid();
    }

    auto add_binding(ScopeId in, std::string_view name, Binding b)
        -> SymbolId {
        auto& s = get_scope(in);
        auto  id = s.find(name);
        if (id.is_invalid()) {
            id = SymbolId::from_raw_data(
                static_cast<uint32_t>(c.symbols.size()));
            c.symbols.push_back({
                .name = name,
                .kind = b.kind,
                .scope = in,
                .module = module,
                .bindings = {},
                .qualified_name = {},
            });

            s.symbols.push_back(id);
            s.names[name] = id;

            if (in == module_scope()) get_unit(b.unit).defines.push_back(id);
        } else {
            auto const& sym = c.symbols.at(id.value());
            if (auto first = find_duplicate(sym, b); first.is_valid()) {
                c.duplicates.push_back(
                    {.symbol = id, .first = first, .second = b.node});
            }
        }

        c.node_binding.at(b.node.value()) = id;
        c.symbols.at(id.value()).bindings.push_back(std::move(b));
        return id;
    }

    // Bind a name in `in`, following `global` and `nonlocal` declarations of
    // that scope.
    auto bind(ScopeId in, NodeId node, std::string_view name, NodeId def,
              SymbolKind kind) -> SymbolId {
        auto binding = Binding{
            .node = node,
            .def = def,
            .kind = kind,
            .unit = unit,
            .branches = branches,
        };

        auto const& s = get_scope(in);
        if (s.globals.contains(name)) {
            return add_binding(module_scope(), name, std::move(binding));
        }

        if (s.nonlocals.contains(name)) {
            pending.push_back(
                {.scope = in, .name = name, .binding = std::move(binding)});
            return SymbolId::invalid();
        }

        return add_binding(in, name, std::move(binding));
    }

    // the nearest enclosing function scope that binds `name`
    auto find_enclosing(ScopeId from, std::string_view name) -> SymbolId {
        auto id = get_scope(from).parent;
        while (id.is_valid()) {
            auto const& s = get_scope(id);
            if (s.kind == ScopeKind::Module) break;

            if (s.kind == ScopeKind::Function && !s.nonlocals.contains(name)) {
                if (auto sym = s.find(name); sym.is_valid()) return sym;
            }

            id = s.parent;
        }

        return SymbolId::invalid();
    }

    void finish() {
        for (auto const& [s, node] : nonlocal_decls) {
            if (find_enclosing(s, ast.get(node).str).is_invalid())
                table().undeclared.push_back(node);
        }

        for (auto& p : pending) {
            auto sym = find_enclosing(p.scope, p.name);
            if (sym.is_invalid()) continue;

            c.node_binding.at(p.binding.node.value()) = sym;
            c.symbols.at(sym.value()).bindings.push_back(std::move(p.binding));
        }
    }

    // ------------------------------------------------------------------------

    void visit_children(NodeId id) {
        for (auto child : ast.children(id)) visit(child);
    }

    void visit_branch(NodeId id, NodeId owner, uint32_t index) {
        if (id.is_invalid()) return;

        branches.push_back({.node = owner, .index = index});
        visit(id);
        branches.pop_back();
    }

    // annotations and defaults are evaluated in the enclosing scope
    void visit_param_headers(NodeId params) {
        enter(params);
        for (auto param : ast.children(params)) visit_children(param);
    }

    void bind_params(NodeId params) {
        for (auto param : ast.children(params)) {
            enter(param);
            bind(scope, param, ast.get(param).str, param,
                 SymbolKind::Parameter);
        }
    }

    // Is the function directly in the body of a top-level class.
    [[nodiscard]] auto is_method_of_top_level_class(NodeId fn) -> bool {
        auto const& s = get_scope(scope);
        if (s.kind != ScopeKind::Class || s.parent != module_scope())
            return false;
        if (ast.parent(s.node) != table().root) return false;

        return ast.parent(fn) == ast.child(s.node, 3);
    }

    void visit_function(NodeId id) {
        auto const& node = ast.get(id);
        auto        ch = ast.children(id);

        visit(ch[1]);
        visit_param_headers(ch[2]);
        if (ch[3].is_valid()) visit(ch[3]);

        record_name(ch[0]);
        bind(scope, ch[0], node.str, id, SymbolKind::Function);

        auto in_class = get_scope(scope).kind == ScopeKind::Class;
        auto outer = scope;
        auto method = is_method_of_top_level_class(id)
                          ? new_unit(UnitKind::Method, id, unit)
                          : UnitId::invalid();

        auto saved = save();
        scope = new_scope(ScopeKind::Function, id);
        if (method.is_valid()) unit = method;
        if (mode == Mode::Eager) mode = Mode::Lazy;
        branches.clear();

        if (in_class) {
            auto params = ast.children(ch[2]);
            self_name = params.empty() ? std::string_view{}
                                       : ast.get(params[0]).str;
            self_class = outer;
        }

        bind_params(ch[2]);
        visit(ch[4]);

        restore(std::move(saved));
    }

    void visit_class(NodeId id) {
        auto const& node = ast.get(id);
        auto        ch = ast.children(id);

        visit(ch[1]);
        visit(ch[2]);

        record_name(ch[0]);
        auto sym = bind(scope, ch[0], node.str, id, SymbolKind::Class);

        auto saved = save();
        scope = new_scope(ScopeKind::Class, id);
        if (sym.is_valid()) c.class_scopes.try_emplace(sym, scope);
        branches.clear();
        self_name = {};
        self_class = ScopeId::invalid();

        visit(ch[3]);

        restore(std::move(saved));
    }

    void visit_lambda(NodeId id) {
        auto params = ast.child(id, 0);
        visit_param_headers(params);

        auto saved = save();
        scope = new_scope(ScopeKind::Function, id);
        if (mode == Mode::Eager) mode = Mode::Lazy;
        branches.clear();

        bind_params(params);
        visit(ast.child(id, 1));

        restore(std::move(saved));
    }

    void visit_comprehension(NodeId id) {
        auto   ch = ast.children(id);
        size_t first = ast.kind_of(id) == NodeKind::DictComp ? 2 : 1;

        // the first iterable is evaluated in the enclosing scope
        visit(ast.child(ch[first], 1));

        auto saved = save();
        scope = new_scope(ScopeKind::Comprehension, id);
        branches.clear();

        for (size_t i = first; i < ch.size(); i++) {
            enter(ch[i]);

            auto gen = ast.children(ch[i]);
            visit(gen[0]);
            if (i != first) visit(gen[1]);
            for (size_t j = 2; j < gen.size(); j++) visit(gen[j]);
        }

        for (size_t i = 0; i < first; i++) visit(ch[i]);

        restore(std::move(saved));
    }

    void visit_named_expr(NodeId id) {
        auto target = ast.child(id, 0);
        visit(ast.child(id, 1));

        auto in = scope;
        while (get_scope(in).kind == ScopeKind::Comprehension)
            in = get_scope(in).parent;

        auto saved_scope = scope;
        scope = in;
        record_name(target);
        bind(in, target, ast.get(target).str, target, SymbolKind::Variable);
        scope = saved_scope;
    }

    void visit_import(NodeId id) {
        auto const& stmt = ast.get(id);
        table().imports.push_back(id);
        get_unit(unit).imports.push_back(id);

        for (auto alias : ast.children(id)) {
            enter(alias);

            auto const& node = ast.get(alias);
            if (stmt.kind == NodeKind::ImportFrom && node.str == "*") continue;

            if (auto asname = ast.child(alias, 0); asname.is_valid()) {
                record_name(asname);
                bind(scope, asname, ast.get(asname).str, alias,
                     SymbolKind::Import);
                continue;
            }

            auto name = stmt.kind == NodeKind::Import ? first_segment(node.str)
                                                      : node.str;
            bind(scope, alias, name, alias, SymbolKind::Import);
        }
    }

    void visit_try(NodeId id) {
        auto ch = ast.children(id);
        if (!is_guarded_try(ast, id)) {
            visit_children(id);
            return;
        }

        // the body and `else` run together, each handler is an alternative
        visit_branch(ch[0], id, 0);
        visit_branch(ch[1], id, 0);
        if (ch[2].is_valid()) visit(ch[2]);

        for (size_t i = 3; i < ch.size(); i++) {
            visit_branch(ch[i], id, static_cast<uint32_t>(i - 2));
        }
    }

    void visit_ann_assign(NodeId id) {
        auto ch = ast.children(id);
        visit(ch[1]);

        if (ch[2].is_valid()) {
            visit(ch[2]);
            visit(ch[0]);
            return;
        }

        auto const& target = ast.get(ch[0]);
        if (target.kind != NodeKind::Name) {
            visit(ch[0]);
            return;
        }

        // `name: int` declares, but does not bind
        record_name(ch[0]);
        auto& s = get_scope(scope);
        if (s.kind == ScopeKind::Class) s.instance_attrs.insert(target.str);
    }

    void visit_attribute(NodeId id) {
        auto const& node = ast.get(id);
        table().attributes.push_back(id);

        auto value = ast.child(id, 0);
        if (node.is_store() && self_class.is_valid() && !self_name.empty()) {
            auto const& v = ast.get(value);
            if (v.kind == NodeKind::Name && v.str == self_name)
                get_scope(self_class).instance_attrs.insert(node.str);
        }

        visit(value);
    }

    void visit_declaration(NodeId id) {
        auto is_global = ast.kind_of(id) == NodeKind::Global;
        for (auto name : ast.children(id)) {
            auto& s = get_scope(scope);
            auto  str = ast.get(name).str;
            if (is_global) {
                s.globals.insert(str);
            } else {
                s.nonlocals.insert(str);
                nonlocal_decls.emplace_back(scope, name);
            }

            record_name(name);
        }
    }

    void visit(NodeId id) {
        if (id.is_invalid()) return;
        enter(id);

        auto const& node = ast.get(id);
        switch (node.kind) {
            case NodeKind::FunctionDef: visit_function(id); break;
            case NodeKind::ClassDef: visit_class(id); break;
            case NodeKind::Lambda: visit_lambda(id); break;

            case NodeKind::ListComp:
            case NodeKind::SetComp:
            case NodeKind::GeneratorExp:
            case NodeKind::DictComp: visit_comprehension(id); break;

            case NodeKind::NamedExpr: visit_named_expr(id); break;

            case NodeKind::Import:
            case NodeKind::ImportFrom: visit_import(id); break;

            case NodeKind::If: {
                visit(ast.child(id, 0));
                visit_branch(ast.child(id, 1), id, 0);
                visit_branch(ast.child(id, 2), id, 1);
            } break;

            case NodeKind::Try: visit_try(id); break;
            case NodeKind::AnnAssign: visit_ann_assign(id); break;
            case NodeKind::Attribute: visit_attribute(id); break;

            case NodeKind::Global:
            case NodeKind::Nonlocal: visit_declaration(id); break;

            case NodeKind::Name: {
                record_name(id);
                if (node.is_store())
                    bind(scope, id, node.str, id, SymbolKind::Variable);
            } break;

            case NodeKind::ForwardRef: {
                auto saved = mode;
                mode = Mode::Weak;
                visit_children(id);
                mode = saved;
            } break;

            case NodeKind::Assign: {
                // the value is evaluated before the targets are bound
                auto ch = ast.children(id);
                visit(ch.back());
                for (auto target : ch.first(ch.size() - 1)) visit(target);
            } break;

            case NodeKind::For: {
                auto ch = ast.children(id);
                visit(ch[1]);
                visit(ch[0]);
                for (auto rest : ch.subspan(2)) visit(rest);
            } break;

            case NodeKind::AugAssign: {
                visit(ast.child(id, 1));
                visit(ast.child(id, 0));
            } break;

            case NodeKind::ExceptHandler:
            case NodeKind::While:
            case NodeKind::With:
            case NodeKind::WithItem:
            case NodeKind::Return:
            case NodeKind::Raise:
            case NodeKind::Pass:
            case NodeKind::Break:
            case NodeKind::Continue:
            case NodeKind::Delete:
            case NodeKind::Assert:
            case NodeKind::ExprStmt:
            case NodeKind::Block:
            case NodeKind::Decorators:
            case NodeKind::Arguments:
            case NodeKind::Subscript:
            case NodeKind::Slice:
            case NodeKind::Call:
            case NodeKind::BinOp:
            case NodeKind::UnaryOp:
            case NodeKind::BoolOp:
            case NodeKind::Compare:
            case NodeKind::IfExp:
            case NodeKind::Await:
            case NodeKind::Yield:
            case NodeKind::YieldFrom:
            case NodeKind::Tuple:
            case NodeKind::List:
            case NodeKind::Set:
            case NodeKind::Dict:
            case NodeKind::Starred:
            case NodeKind::DoubleStarred:
            case NodeKind::Keyword:
            case NodeKind::Constant:
            case NodeKind::Str: visit_children(id); break;

            case NodeKind::Module:
            case NodeKind::Params:
            case NodeKind::Param:
            case NodeKind::ImportAlias:
            case NodeKind::Comprehension:
                UNREACHABLE("node visited outside of its parent", node.kind);
        }
    }

    // ------------------------------------------------------------------------

    [[nodiscard]] auto is_plain_definition(NodeId stmt) -> bool {
        auto const& node = ast.get(stmt);

        NodeId value;
        std::vector<std::string_view> targets;
        if (node.kind == NodeKind::Assign) {
            auto ch = ast.children(stmt);
            value = ch.back();
            for (auto target : ch.first(ch.size() - 1)) {
                if (!collect_plain_targets(ast, target, targets)) return false;
            }
        } else if (node.kind == NodeKind::AnnAssign) {
            value = ast.child(stmt, 2);
            if (value.is_invalid()) return false;
            if (!collect_plain_targets(ast, ast.child(stmt, 0), targets))
                return false;
        } else {
            return false;
        }

        if (may_call(ast, value)) return false;

        auto const& s = get_scope(module_scope());
        for (auto name : targets) {
            if (s.find(name).is_valid()) return false;
            if (name == "__all__" && table().is_entry) return false;
        }

        return true;
    }

    [[nodiscard]] auto classify(NodeId stmt, bool is_first) -> UnitKind {
        switch (ast.kind_of(stmt)) {
            case NodeKind::FunctionDef:
            case NodeKind::ClassDef: return UnitKind::Definition;
            case NodeKind::Import:
            case NodeKind::ImportFrom: return UnitKind::Import;
            default: break;
        }

        if (is_first && is_docstring(ast, stmt)) return UnitKind::Docstring;
        if (is_entry_block(ast, stmt)) return UnitKind::EntryBlock;
        if (is_guarded_import(ast, stmt)) return UnitKind::GuardedImport;
        if (is_plain_definition(stmt)) return UnitKind::Definition;

        return UnitKind::Statement;
    }

    void build(NodeId root) {
        auto first = true;
        for (auto stmt : ast.children(root)) {
            auto kind = classify(stmt, first);
            first = false;

            unit = new_unit(kind, stmt, UnitId::invalid());
            table().units.push_back(unit);

            visit(stmt);
        }

        finish();
    }
};

// ============================================================================

auto Catalog::add_module(NodeId root, FileId fileid, bool is_entry)
    -> uint32_t {
    ASSERT(ast->kind_of(root) == NodeKind::Module);

    node_scope.resize(ast->size(), ScopeId::invalid());
    node_unit.resize(ast->size(), UnitId::invalid());
    node_binding.resize(ast->size(), SymbolId::invalid());

    auto idx = static_cast<uint32_t>(modules.size());
    modules.push_back({
        .fileid = fileid,
        .root = root,
        .scope = ScopeId::invalid(),
        .is_entry = is_entry,
        .units = {},
        .names = {},
        .attributes = {},
        .imports = {},
        .undeclared = {},
    });

    Builder b{.c = *this, .ast = *ast, .module = idx};
    auto    scope = b.new_scope(ScopeKind::Module, root);
    modules.back().scope = scope;
    b.scope = scope;

    node_scope.at(root.value()) = scope;
    b.build(root);

    return idx;
}

auto Catalog::scope_of(NodeId node) const -> ScopeId {
    if (node.is_invalid() || node.value() >= node_scope.size())
        return ScopeId::invalid();
    return node_scope[node.value()];
}

auto Catalog::unit_of(NodeId node) const -> UnitId {
    if (node.is_invalid() || node.value() >= node_unit.size())
        return UnitId::invalid();
    return node_unit[node.value()];
}

auto Catalog::symbol_bound_by(NodeId node) const -> SymbolId {
    if (node.is_invalid() || node.value() >= node_binding.size())
        return SymbolId::invalid();
    return node_binding[node.value()];
}

auto Catalog::class_scope_of(SymbolId cls) const -> ScopeId {
    if (auto it = class_scopes.find(cls); it != class_scopes.end())
        return it->second;
    return ScopeId::invalid();
}

void Catalog::set_qualified_name(SymbolId id, std::string name) {
    auto& sym = symbols.at(id.value());
    ASSERT(sym.qualified_name.empty(), "qualified name set twice", sym.name);

    sym.qualified_name = std::move(name);
}

auto format_as(ScopeKind kind) -> std::string_view {
    switch (kind) {
        case ScopeKind::Module: return "module";
        case ScopeKind::Class: return "class";
        case ScopeKind::Function: return "function";
        case ScopeKind::Comprehension: return "comprehension";
    }

    return "?";
}

auto format_as(SymbolKind kind) -> std::string_view {
    switch (kind) {
        case SymbolKind::Function: return "function";
        case SymbolKind::Class: return "class";
        case SymbolKind::Variable: return "variable";
        case SymbolKind::Import: return "import";
        case SymbolKind::Parameter: return "parameter";
    }

    return "?";
}

auto format_as(UnitKind kind) -> std::string_view {
    switch (kind) {
        case UnitKind::Definition: return "definition";
        case UnitKind::Method: return "method";
        case UnitKind::Import: return "import";
        case UnitKind::GuardedImport: return "guarded-import";
        case UnitKind::EntryBlock: return "entry-block";
        case UnitKind::Docstring: return "docstring";
        case UnitKind::Statement: return "statement";
    }

    return "?";
}

void to_json(nlohmann::json& j, Symbol const& s) {
    j = nlohmann::json{
        {  "name",            s.name},
        {  "kind", format_as(s.kind)},
        { "scope",           s.scope},
        {"module",          s.module},
    };

    if (!s.qualified_name.empty()) j["qualified_name"] = s.qualified_name;
}

}  // namespace fuse

auto fmt::formatter<fuse::ScopeKind>::format(fuse::ScopeKind const& p,
                                             format_context& ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(fuse::format_as(p), ctx);
}

auto fmt::formatter<fuse::SymbolKind>::format(fuse::SymbolKind const& p,
                                              format_context& ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(fuse::format_as(p), ctx);
}

auto fmt::formatter<fuse::UnitKind>::format(fuse::UnitKind const& p,
                                            format_context& ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(fuse::format_as(p), ctx);
}
