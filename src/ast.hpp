#pragma once

#include <cstdint>
#include <initializer_list>
#include <nlohmann/json_fwd.hpp>
#include <span>
#include <string_view>
#include <vector>

#include "arena.hpp"
#include "ast-node-id.hpp"
#include "ast-node.hpp"
#include "location.hpp"

namespace fuse::ast {

/// Owns all nodes of one or more parsed files. Nodes are never removed nor
/// changed after their parent is created, so an `Ast` can be shared read-only
/// by every stage that runs after parsing.
class Ast {
public:
    Ast() = default;

    // create a new node, adopting the given children
    [[nodiscard]] auto new_node(NodeKind kind, Span span,
                                std::span<NodeId const> children = {},
                                std::string_view str = {}, uint32_t flags = 0)
        -> NodeId;

    [[nodiscard]] auto new_node(NodeKind kind, Span span,
                                std::initializer_list<NodeId> children,
                                std::string_view str = {}, uint32_t flags = 0)
        -> NodeId {
        return new_node(kind, span,
                        std::span<NodeId const>{children.begin(),
                                                children.size()},
                        str, flags);
    }

    // Get a node given its id. Throws `std::out_of_range` for invalid ids.
    [[nodiscard]] auto get(NodeId id) const -> Node const&;

    [[nodiscard]] auto kind_of(NodeId id) const -> NodeKind {
        return get(id).kind;
    }

    [[nodiscard]] auto children(NodeId id) const -> std::span<NodeId const>;

    // Get the child at `idx`, which may be an invalid id for optional children.
    [[nodiscard]] auto child(NodeId id, size_t idx) const -> NodeId;

    [[nodiscard]] auto parent(NodeId id) const -> NodeId {
        return get(id).parent;
    }

    // Copy a string into the AST, making its lifetime the same as the AST.
    [[nodiscard]] auto dupe_string(std::string_view s) -> std::string_view {
        return strings.alloc_string_view(s);
    }

    // Change the context of an expression (and of its elements when it is a
    // tuple, list or starred). Only used by the parser, before the node gets a
    // parent.
    void set_ctx(NodeId id, ExprContext ctx);

    // Change the flags of a node. Only used by the parser.
    void set_flags(NodeId id, uint32_t flags);

    [[nodiscard]] constexpr auto size() const -> size_t {
        return nodes.size();
    }

    [[nodiscard]] constexpr auto refs_size() const -> size_t {
        return refs.size();
    }

private:
    std::vector<Node>   nodes;
    std::vector<NodeId> refs;
    mem::Arena          strings;
};

/// The text between the quotes of a string literal, without its prefix. Only
/// meaningful for a single literal, concatenated literals keep their inner
/// quotes.
[[nodiscard]] auto string_literal_body(std::string_view literal)
    -> std::string_view;

/// Dump a node and all of its children.
[[nodiscard]] auto dump_node(Ast const& ast, NodeId id) -> nlohmann::json;

}  // namespace fuse::ast
