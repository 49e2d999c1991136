#pragma once

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace fuse {

struct ArgIterator {
    int    argc;
    char** argv;

    constexpr auto next(std::string_view& arg) -> bool {
        if (argc == 0) return false;

        argc--;
        arg = std::string_view{*argv++};
        return true;
    }

    [[nodiscard]] constexpr auto empty() const -> bool { return argc == 0; }
};

auto read_entire_file(std::string const& path) -> std::optional<std::string>;
auto write_file(std::string const& path, std::string_view contents) -> bool;

/// Is the given name a `__dunder__` name.
[[nodiscard]] constexpr auto is_dunder(std::string_view name) -> bool {
    return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

/// A `FILE*` that writes into memory. Used to capture reporter output.
struct MemStream {
    MemStream() : f{open_memstream(&buf, &bufsize)} {}
    ~MemStream() {
        if (f) fclose(f);
        f = nullptr;

        free(buf);
        buf = nullptr;
        bufsize = 0;
    }

    MemStream(MemStream const&) = delete;
    MemStream(MemStream&&) = delete;
    auto operator=(MemStream const&) -> MemStream& = delete;
    auto operator=(MemStream&&) -> MemStream& = delete;

    void flush() const { fflush(f); }

    [[nodiscard]] auto flush_str() const -> std::string_view {
        flush();
        return str();
    }

    [[nodiscard]] constexpr auto str() const -> std::string_view {
        return {buf, bufsize};
    }

    FILE* f{};

    char*  buf{};
    size_t bufsize{};
};

}  // namespace fuse
