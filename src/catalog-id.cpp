#include "catalog-id.hpp"

#include <nlohmann/json.hpp>

namespace fuse {

namespace {

template <typename T>
void id_to_json(nlohmann::json &j, T const &n) {
    if (n.is_valid())
        j = n.value();
    else
        j = nullptr;
}

}  // namespace

void to_json(nlohmann::json &j, ScopeId const &n) { id_to_json(j, n); }
void to_json(nlohmann::json &j, SymbolId const &n) { id_to_json(j, n); }
void to_json(nlohmann::json &j, UnitId const &n) { id_to_json(j, n); }

}  // namespace fuse

auto fmt::formatter<fuse::ScopeId>::format(fuse::ScopeId const &p,
                                       format_context &ctx) const
    -> format_context::iterator {
    if (!p.is_valid()) return fmt::format_to(ctx.out(), "ScopeId(<invalid>)");
    return fmt::format_to(ctx.out(), "ScopeId({})", p.value());
}

auto fmt::formatter<fuse::SymbolId>::format(fuse::SymbolId const &p,
                                       format_context &ctx) const
    -> format_context::iterator {
    if (!p.is_valid()) return fmt::format_to(ctx.out(), "SymbolId(<invalid>)");
    return fmt::format_to(ctx.out(), "SymbolId({})", p.value());
}

auto fmt::formatter<fuse::UnitId>::format(fuse::UnitId const &p,
                                       format_context &ctx) const
    -> format_context::iterator {
    if (!p.is_valid()) return fmt::format_to(ctx.out(), "UnitId(<invalid>)");
    return fmt::format_to(ctx.out(), "UnitId({})", p.value());
}
