#include "arena.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <libassert/assert.hpp>
#include <new>

namespace fuse::mem {

Arena::~Arena() {
    for (auto it = head; it != nullptr;) {
        auto blk = it;
        it = it->next;
        free(blk);
    }

    head = nullptr;
}

auto Arena::mem_alloc(std::size_t sz) -> void* {
    ASSERT(sz > 0);

    auto blk = get_block_with_at_least(sz);
    auto ptr = blk->forward(sz);
    ASSERT(ptr != nullptr);

    used += sz;
    return ptr;
}

auto Arena::get_block_with_at_least(std::size_t sz) -> Block* {
    if (head != nullptr && head->fits(sz)) return head;

    // file contents may be larger than a block, those get a block of their own
    auto padded = sz + sizeof(uintptr_t);
    return new_block(std::max<std::size_t>(BLOCK_SIZE, sizeof(Block) + padded));
}

auto Arena::new_block(std::size_t size) -> Block* {
    auto mem = malloc(size);
    if (mem == nullptr) throw std::bad_alloc{};

    auto bytes = static_cast<uint8_t*>(mem);
    auto blk = static_cast<Block*>(mem);

    *blk = {.next = head, .end = bytes + size, .head = blk->data};
    head = blk;
    return head;
}

auto Arena::alloc_string(std::string_view s) -> std::span<char> {
    if (s.empty()) return {};

    auto      mem = static_cast<char*>(mem_alloc(s.size()));
    std::span dst{mem, s.size()};
    std::ranges::copy(s, dst.begin());

    return dst;
}

}  // namespace fuse::mem
