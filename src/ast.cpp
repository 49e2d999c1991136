#include "ast.hpp"

#include <stdexcept>
#include <string>

#include "fmt/format.h"
#include "libassert/assert.hpp"
#include "nlohmann/json.hpp"

namespace fuse::ast {

auto Ast::new_node(NodeKind kind, Span span, std::span<NodeId const> children,
                   std::string_view str, uint32_t flags) -> NodeId {
    auto id = NodeId::from_raw_data(static_cast<uint32_t>(nodes.size()));

    auto first = static_cast<uint32_t>(refs.size());
    for (auto child : children) {
        refs.push_back(child);
        if (child.is_valid()) {
            ASSERT(child.value() < nodes.size());
            nodes.at(child.value()).parent = id;
        }
    }

    nodes.push_back({
        .kind = kind,
        .flags = flags,
        .span = span,
        .str = str,
        .first_child = first,
        .child_count = static_cast<uint32_t>(children.size()),
        .parent = NodeId::invalid(),
    });

    return id;
}

auto Ast::get(NodeId id) const -> Node const& {
    if (id.is_invalid() || id.value() >= nodes.size())
        throw std::out_of_range{fmt::format("invalid node id: {}", id)};

    return nodes[id.value()];
}

auto Ast::children(NodeId id) const -> std::span<NodeId const> {
    auto const& node = get(id);
    return std::span{refs}.subspan(node.first_child, node.child_count);
}

auto Ast::child(NodeId id, size_t idx) const -> NodeId {
    auto c = children(id);
    if (idx >= c.size()) return NodeId::invalid();

    return c[idx];
}

void Ast::set_ctx(NodeId id, ExprContext ctx) {
    auto& node = nodes.at(id.value());
    switch (node.kind) {
        case NodeKind::Name:
        case NodeKind::Attribute:
        case NodeKind::Subscript:
            node.flags = static_cast<uint32_t>(ctx);
            break;

        case NodeKind::Tuple:
        case NodeKind::List:
        case NodeKind::Starred:
            node.flags = static_cast<uint32_t>(ctx);
            for (auto child : children(id)) set_ctx(child, ctx);
            break;

        default: UNREACHABLE("expression can not have a context", node.kind);
    }
}

void Ast::set_flags(NodeId id, uint32_t flags) {
    nodes.at(id.value()).flags = flags;
}

auto string_literal_body(std::string_view literal) -> std::string_view {
    auto start = literal.find_first_of("'\"");
    if (start == std::string_view::npos) return {};

    auto quote = literal.substr(start, 1);
    if (literal.substr(start, 3) == std::string(3, literal[start])) {
        quote = literal.substr(start, 3);
    }

    auto body = literal.substr(start + quote.size());
    if (body.size() < quote.size()) return {};

    return body.substr(0, body.size() - quote.size());
}

auto dump_node(Ast const& ast, NodeId id) -> nlohmann::json {
    if (id.is_invalid()) return nullptr;

    auto const& node = ast.get(id);

    auto j = nlohmann::json{
        {"kind", fmt::to_string(node.kind)},
        {  "id",                        id},
        {"span",                 node.span},
    };

    if (!node.str.empty()) j["str"] = node.str;
    if (node.flags != 0) j["flags"] = node.flags;

    auto children = ast.children(id);
    if (!children.empty()) {
        auto arr = nlohmann::json::array();
        for (auto child : children) arr.push_back(dump_node(ast, child));

        j["children"] = arr;
    }

    return j;
}

}  // namespace fuse::ast
