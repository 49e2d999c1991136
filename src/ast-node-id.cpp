#include "ast-node-id.hpp"

#include <nlohmann/json.hpp>

namespace fuse::ast {

void to_json(json &j, NodeId const &n) {
    if (n.is_valid())
        j = n.value();
    else
        j = {};  // null
}

}  // namespace fuse::ast

auto fmt::formatter<fuse::ast::NodeId>::format(fuse::ast::NodeId const &p,
                                               format_context &ctx) const
    -> format_context::iterator {
    if (!p.is_valid()) return fmt::format_to(ctx.out(), "NodeId(<invalid>)");
    return fmt::format_to(ctx.out(), "NodeId({})", p.value());
}
