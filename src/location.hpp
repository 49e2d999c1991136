#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string_view>

#include "file-store.hpp"
#include "macros.hpp"

namespace fuse {

/// Byte range `[begin, end)` inside of a single source file.
struct Span {
    uint32_t begin;
    uint32_t end;

    [[nodiscard]] constexpr auto size() const -> uint32_t {
        return end - begin;
    }

    [[nodiscard]] constexpr auto str(std::string_view source) const
        -> std::string_view {
        return source.substr(begin, size());
    }

    [[nodiscard]] constexpr auto extend(Span o) const -> Span {
        return {.begin = begin, .end = o.end};
    }

    [[nodiscard]] constexpr auto contains(Span o) const -> bool {
        return begin <= o.begin && o.end <= end;
    }

    constexpr auto operator==(Span const &o) const -> bool = default;
};

struct Location {
    FileId fileid;
    Span   span;

    [[nodiscard]] constexpr auto str(std::string_view source) const
        -> std::string_view {
        return span.str(source);
    }

    constexpr auto operator==(Location const &o) const -> bool = default;
};

// ============================================================================

void to_json(nlohmann::json &j, Span const &span);
void to_json(nlohmann::json &j, Location const &location);

}  // namespace fuse

// ============================================================================

define_formatter_from_string_view(fuse::Span);
define_formatter_from_string_view(fuse::Location);
