#include "errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <nlohmann/json.hpp>

namespace fuse {

CircularDependencyError::CircularDependencyError(
    std::vector<std::string> symbols, std::vector<Location> locations)
    : MergeError{FindingKind::CircularDependency,
                 fmt::format("circular dependency detected among symbols: {}",
                             fmt::join(symbols, ", ")),
                 std::move(locations)},
      symbols{std::move(symbols)} {}

auto format_as(FindingKind kind) -> std::string_view {
    switch (kind) {
        case FindingKind::ParseFailure: return "parse-failure";
        case FindingKind::UnsupportedConstruct: return "unsupported-construct";
        case FindingKind::DuplicateDefinition: return "duplicate-definition";
        case FindingKind::UnresolvedReference: return "unresolved-reference";
        case FindingKind::CircularDependency: return "circular-dependency";
        case FindingKind::MultipleEntryBlocks: return "multiple-entry-blocks";
        case FindingKind::RelativeImport: return "relative-import";
        case FindingKind::ConditionalImport: return "conditional-import";
    }

    return "?";
}

void to_json(nlohmann::json& j, FindingKind const& kind) {
    j = format_as(kind);
}

}  // namespace fuse

auto fmt::formatter<fuse::FindingKind>::format(fuse::FindingKind const& p,
                                               format_context& ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(fuse::format_as(p), ctx);
}
