#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string_view>

#include "ast-node-id.hpp"
#include "location.hpp"
#include "macros.hpp"

namespace fuse::ast {

/// The kind of a node. The children of each node are stored as a contiguous
/// array of `NodeId`, their layout depends on the kind and is documented
/// here. Optional children are present as invalid ids.
enum class NodeKind : uint8_t {
    /// The root of a file.
    /// - children: statements
    Module,

    // ------------------------------------------------------------------------
    // Statements

    /// `def name(params) -> returns: body`, `flags` has `ASYNC` for
    /// `async def`. The span starts at the first decorator.
    /// - str: the name
    /// - children: `[name(Name), decorators, params, returns?, body]`
    FunctionDef,
    /// `class name(args): body`. The span starts at the first decorator.
    /// - str: the name
    /// - children: `[name(Name), decorators, args(Arguments), body]`
    ClassDef,
    /// - children: decorator expressions
    Decorators,
    /// - children: `Param` nodes
    Params,
    /// A single parameter, the span is the span of its name.
    /// - str: the name
    /// - flags: `ParamKind`
    /// - children: `[annotation?, default?]`
    Param,
    /// Call arguments and class bases.
    /// - children: expressions, `Starred`, `DoubleStarred` and `Keyword`
    Arguments,
    /// A sequence of statements.
    /// - children: statements
    Block,
    /// - children: `[test, body(Block), orelse?]`, where `orelse` is a
    ///   `Block` or an `If` for `elif`.
    If,
    /// - children: `[test, body, orelse?]`
    While,
    /// - flags: `ASYNC`
    /// - children: `[target, iter, body, orelse?]`
    For,
    /// - children: `[body, orelse?, finalbody?, handlers(ExceptHandler)...]`
    Try,
    /// `except type as name: body`
    /// - children: `[type?, name(Name)?, body]`
    ExceptHandler,
    /// - flags: `ASYNC`
    /// - children: `[body, items(WithItem)...]`
    With,
    /// - children: `[context, target?]`
    WithItem,
    /// - children: `[value?]`
    Return,
    /// - children: `[exc?, cause?]`
    Raise,
    Pass,
    Break,
    Continue,
    /// - children: `Name` nodes
    Global,
    /// - children: `Name` nodes
    Nonlocal,
    /// - children: targets
    Delete,
    /// - children: `[test, msg?]`
    Assert,
    /// - children: `[value]`
    ExprStmt,
    /// `a = b = value`
    /// - children: `[targets..., value]`
    Assign,
    /// - str: the operator, like `+=`
    /// - children: `[target, value]`
    AugAssign,
    /// - children: `[target, annotation, value?]`
    AnnAssign,
    /// - children: `ImportAlias` nodes
    Import,
    /// - str: the (dotted) module, may be empty for `from . import x`
    /// - flags: the level of a relative import (number of dots)
    /// - children: `ImportAlias` nodes
    ImportFrom,
    /// `a.b.c as d` on `Import`, `name as d` or `*` on `ImportFrom`.
    /// - str: the (dotted) imported name
    /// - children: `[asname(Name)?]`
    ImportAlias,

    // ------------------------------------------------------------------------
    // Expressions

    /// - str: the identifier
    /// - flags: `ExprContext`
    Name,
    /// `value.attr`
    /// - str: the attribute name
    /// - flags: `ExprContext`
    /// - children: `[value]`
    Attribute,
    /// `value[slice]`
    /// - flags: `ExprContext`
    /// - children: `[value, slice]`
    Subscript,
    /// `lower:upper:step`
    /// - children: `[lower?, upper?, step?]`
    Slice,
    /// - children: `[func, args(Arguments)]`
    Call,
    /// - str: the operator
    /// - children: `[left, right]`
    BinOp,
    /// - str: the operator (`-`, `+`, `~` or `not`)
    /// - children: `[operand]`
    UnaryOp,
    /// - str: `and` or `or`
    /// - children: values
    BoolOp,
    /// `a < b <= c`
    /// - str: the operators, separated by `,`
    /// - children: `[left, comparators...]`
    Compare,
    /// `body if test else orelse`
    /// - children: `[body, test, orelse]`
    IfExp,
    /// - children: `[params(Params), body]`
    Lambda,
    /// `target := value`
    /// - children: `[target(Name), value]`
    NamedExpr,
    /// - children: `[value]`
    Await,
    /// - children: `[value?]`
    Yield,
    /// - children: `[value]`
    YieldFrom,
    /// - flags: `ExprContext`
    /// - children: elements
    Tuple,
    /// - flags: `ExprContext`
    /// - children: elements
    List,
    /// - children: elements
    Set,
    /// - children: `[key?, value]...`, a missing key is a `**value` entry
    Dict,
    /// - children: `[elt, generators(Comprehension)...]`
    ListComp,
    /// - children: `[elt, generators(Comprehension)...]`
    SetComp,
    /// - children: `[elt, generators(Comprehension)...]`
    GeneratorExp,
    /// - children: `[key, value, generators(Comprehension)...]`
    DictComp,
    /// `for target in iter if cond...`
    /// - flags: `ASYNC`
    /// - children: `[target, iter, ifs...]`
    Comprehension,
    /// `*value`
    /// - flags: `ExprContext`
    /// - children: `[value]`
    Starred,
    /// `**value` in a call
    /// - children: `[value]`
    DoubleStarred,
    /// `name=value` in a call
    /// - str: the name
    /// - children: `[value]`
    Keyword,
    /// Numbers, `None`, `True`, `False` and `...`.
    /// - flags: `ConstantKind`
    Constant,
    /// One or more adjacent string literals. The source text is the literal.
    /// - flags: `STR_FSTRING`, `STR_BYTES`, `STR_CONCAT`
    /// - children: the expressions of f-string replacement fields
    Str,
    /// A string annotation that was parsed as an expression.
    /// - children: `[expr]`
    ForwardRef,
};

enum class ExprContext : uint8_t { Load, Store, Del };
enum class ParamKind : uint8_t { Normal, VarArgs, KwOnly, VarKw };
enum class ConstantKind : uint8_t { Number, None, True, False, Ellipsis };

static constexpr uint32_t ASYNC = 1 << 0;
static constexpr uint32_t STR_FSTRING = 1 << 0;
static constexpr uint32_t STR_BYTES = 1 << 1;
// more than one literal was concatenated
static constexpr uint32_t STR_CONCAT = 1 << 2;

/// A single node in the AST. Nodes do not own their children, they are just
/// a slice of the `refs` array of the `Ast` that holds them.
struct Node {
    NodeKind         kind;
    uint32_t         flags;
    Span             span;
    std::string_view str;

    uint32_t first_child;
    uint32_t child_count;

    // the node that has this one as a child
    NodeId parent;

    [[nodiscard]] constexpr auto is_oneof(auto&&... k) const -> bool {
        return ((kind == k) || ...);
    }

    [[nodiscard]] constexpr auto get_ctx() const -> ExprContext {
        return static_cast<ExprContext>(flags);
    }

    [[nodiscard]] constexpr auto is_store() const -> bool {
        return get_ctx() == ExprContext::Store;
    }

    [[nodiscard]] constexpr auto is_async() const -> bool {
        return (flags & ASYNC) != 0;
    }

    [[nodiscard]] constexpr auto get_param_kind() const -> ParamKind {
        return static_cast<ParamKind>(flags);
    }

    [[nodiscard]] constexpr auto get_constant_kind() const -> ConstantKind {
        return static_cast<ConstantKind>(flags);
    }

    [[nodiscard]] constexpr auto get_level() const -> uint32_t {
        return flags;
    }
};

/// Is the node kind a statement.
[[nodiscard]] constexpr auto is_stmt(NodeKind kind) -> bool {
    return kind >= NodeKind::FunctionDef && kind <= NodeKind::ImportFrom &&
           kind != NodeKind::Decorators && kind != NodeKind::Params &&
           kind != NodeKind::Param && kind != NodeKind::Arguments &&
           kind != NodeKind::Block && kind != NodeKind::ExceptHandler &&
           kind != NodeKind::WithItem;
}

auto format_as(NodeKind kind) -> std::string_view;

}  // namespace fuse::ast

define_formatter_from_string_view(fuse::ast::NodeKind);
