#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#define define_formatter_from_string_view(T)               \
    template <>                                            \
    struct fmt::formatter<T> : formatter<string_view> {    \
        auto format(T const& p, format_context& ctx) const \
            -> format_context::iterator;                   \
    }

// Handles are hashed by their raw index.
#define define_hash_from_value(T)                                    \
    template <>                                                      \
    struct std::hash<T> {                                            \
        auto operator()(T const& k) const noexcept -> std::size_t {  \
            return std::hash<uint32_t>{}(k.value());                 \
        }                                                            \
    }
