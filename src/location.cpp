#include "location.hpp"

#include <fmt/format.h>

#include <nlohmann/json.hpp>

namespace fuse {

void to_json(nlohmann::json &j, Span const &span) {
    j = nlohmann::json::array({span.begin, span.end});
}

void to_json(nlohmann::json &j, Location const &location) {
    j = {
        {"file", location.fileid},
        {"span",   location.span},
    };
}

}  // namespace fuse

// ============================================================================

auto fmt::formatter<fuse::Span>::format(fuse::Span const &p,
                                        format_context   &ctx) const
    -> format_context::iterator {
    return fmt::format_to(ctx.out(), "{}..{}", p.begin, p.end);
}

auto fmt::formatter<fuse::Location>::format(fuse::Location const &p,
                                            format_context       &ctx) const
    -> format_context::iterator {
    return fmt::format_to(ctx.out(), "{}:{}", p.fileid.value(), p.span);
}
