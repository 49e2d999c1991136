#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <nlohmann/json_fwd.hpp>

#include "macros.hpp"

namespace fuse::ast {
using json = nlohmann::json;

/// A handle to an AST node. It is a "stable pointer" that is also half the size
/// on 64bits, and can be used to index side tables that are built for all
/// nodes of an `Ast`.
///
/// The special value of `0xFFFF_FFFF` is used for marking invalid (or
/// missing) nodes, like the `else` of an `if` that has none.
class NodeId {
    static constexpr auto const INVALID_DATA = 0xFFFF'FFFF;

    constexpr explicit NodeId(uint32_t data) : data{data} {}

public:
    /// Default initialize to invalid.
    constexpr NodeId() = default;

    // create a new invalid handle
    static constexpr auto invalid() -> NodeId { return NodeId{}; }

    // create a handle with the given value
    static constexpr auto from_raw_data(uint32_t raw_data) -> NodeId {
        return NodeId{raw_data};
    }

    constexpr auto operator==(NodeId const &o) const -> bool = default;

    /// Get the internal data. Make sure to use it correctly.
    [[nodiscard]] constexpr auto value() const -> uint32_t { return data; }

    [[nodiscard]] constexpr auto is_valid() const -> bool {
        return data != INVALID_DATA;
    }

    [[nodiscard]] constexpr auto is_invalid() const -> bool {
        return !is_valid();
    }

private:
    uint32_t data{INVALID_DATA};
};

void to_json(json &j, NodeId const &n);

}  // namespace fuse::ast

define_formatter_from_string_view(fuse::ast::NodeId);
define_hash_from_value(fuse::ast::NodeId);
