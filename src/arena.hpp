#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

namespace fuse::mem {

/// Bump allocator used for data that lives as long as its owner: file paths,
/// file contents and the strings synthesized by the parser. Nothing allocated
/// here has a destructor called.
class Arena {
    static constexpr auto BLOCK_SIZE = (1 << 10) * 16;  // 16KiB

    struct Block {
        Block*   next{};
        uint8_t* end{};
        uint8_t* head{};
        uint8_t  data[];

        constexpr auto forward(std::size_t sz) -> void* {
            if (!fits(sz)) return nullptr;

            auto ptr = head;
            head += (sz + (sizeof(uintptr_t) - 1)) & -sizeof(uintptr_t);

            return ptr;
        }

        [[nodiscard]] constexpr auto fits(std::size_t sz) const -> bool {
            return sz <= available();
        }

        [[nodiscard]] constexpr auto available() const -> std::size_t {
            return end - head;
        }
    };

public:
    Arena() = default;

    Arena(Arena const& o) = delete;
    Arena(Arena&& o) noexcept : head{o.head} { o.head = nullptr; }

    auto operator=(Arena const&) -> Arena& = delete;
    auto operator=(Arena&& o) noexcept -> Arena& {
        std::swap(head, o.head);
        return *this;
    }

    ~Arena();

    template <typename T, typename U>
    [[nodiscard]] auto alloc(U&& from) -> std::span<T> {
        auto sz = std::ranges::size(from);
        if (sz == 0) return {};

        auto      data = static_cast<T*>(mem_alloc(sz * sizeof(T)));
        std::span to{data, sz};

        std::ranges::copy(from, to.begin());
        return to;
    }

    template <typename T>
    [[nodiscard]] auto alloc_size(std::size_t sz) -> std::span<T> {
        if (sz == 0) return {};

        auto data = static_cast<T*>(mem_alloc(sz * sizeof(T)));
        return {data, sz};
    }

    [[nodiscard]] auto alloc_string(std::string_view s) -> std::span<char>;
    [[nodiscard]] auto alloc_string_view(std::string_view s)
        -> std::string_view {
        auto str = alloc_string(s);
        return {str.data(), str.size()};
    }

    [[nodiscard]] auto mem_alloc(std::size_t sz) -> void*;

    // total bytes handed out, shown by `--verbose load`
    [[nodiscard]] constexpr auto bytes_used() const -> std::size_t {
        return used;
    }

private:
    [[nodiscard]] auto get_block_with_at_least(std::size_t sz) -> Block*;
    [[nodiscard]] auto new_block(std::size_t size) -> Block*;

private:
    Block*      head{};
    std::size_t used{};
};

}  // namespace fuse::mem
