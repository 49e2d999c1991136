#pragma once

#include <string_view>

namespace fuse {

/// Is the name provided by the interpreter without being defined: one of the
/// names of the `builtins` module, or any dunder name like `__file__`.
[[nodiscard]] auto is_builtin(std::string_view name) -> bool;

}  // namespace fuse
