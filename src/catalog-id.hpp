#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

#include "macros.hpp"

namespace fuse {

/// Handle to a `Scope` inside of a `Catalog`.
class ScopeId {
    static constexpr auto const INVALID_DATA = 0xFFFF'FFFF;

    constexpr explicit ScopeId(uint32_t data) : data{data} {}

public:
    /// Default initialize to invalid.
    constexpr ScopeId() = default;

    // create a new invalid handle
    static constexpr auto invalid() -> ScopeId { return ScopeId{}; }

    // create a handle with the given value
    static constexpr auto from_raw_data(uint32_t raw_data) -> ScopeId {
        return ScopeId{raw_data};
    }

    constexpr auto operator==(ScopeId const &o) const -> bool = default;

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

/// Handle to a `Symbol` inside of a `Catalog`. Symbol ids are global to the
/// catalog, so they can be compared across modules.
class SymbolId {
    static constexpr auto const INVALID_DATA = 0xFFFF'FFFF;

    constexpr explicit SymbolId(uint32_t data) : data{data} {}

public:
    /// Default initialize to invalid.
    constexpr SymbolId() = default;

    // create a new invalid handle
    static constexpr auto invalid() -> SymbolId { return SymbolId{}; }

    // create a handle with the given value
    static constexpr auto from_raw_data(uint32_t raw_data) -> SymbolId {
        return SymbolId{raw_data};
    }

    constexpr auto operator==(SymbolId const &o) const -> bool = default;

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

/// Handle to a `Unit`, the granularity at which code is selected, ordered and
/// emitted by a merge.
class UnitId {
    static constexpr auto const INVALID_DATA = 0xFFFF'FFFF;

    constexpr explicit UnitId(uint32_t data) : data{data} {}

public:
    /// Default initialize to invalid.
    constexpr UnitId() = default;

    // create a new invalid handle
    static constexpr auto invalid() -> UnitId { return UnitId{}; }

    // create a handle with the given value
    static constexpr auto from_raw_data(uint32_t raw_data) -> UnitId {
        return UnitId{raw_data};
    }

    constexpr auto operator==(UnitId const &o) const -> bool = default;

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

void to_json(nlohmann::json &j, ScopeId const &n);
void to_json(nlohmann::json &j, SymbolId const &n);
void to_json(nlohmann::json &j, UnitId const &n);

}  // namespace fuse

define_formatter_from_string_view(fuse::ScopeId);
define_formatter_from_string_view(fuse::SymbolId);
define_formatter_from_string_view(fuse::UnitId);
define_hash_from_value(fuse::ScopeId);
define_hash_from_value(fuse::SymbolId);
define_hash_from_value(fuse::UnitId);
