#pragma once

#include <string_view>

namespace fuse {

[[nodiscard]] constexpr auto get_version() -> std::string_view {
    return "0.3.0";
}

}  // namespace fuse
