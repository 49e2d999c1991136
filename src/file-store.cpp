#include "file-store.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string_view>

namespace fs = std::filesystem;

namespace fuse {

auto to_absolute_path(fs::path const &path) -> fs::path {
    return fs::absolute(path).lexically_normal();
}

auto FileStore::File::line_of(uint32_t offset) const -> uint32_t {
    return rowcol_of(offset).first;
}

auto FileStore::File::rowcol_of(uint32_t offset) const
    -> std::pair<uint32_t, uint32_t> {
    if (line_starts.empty()) return {1, offset};

    // first line start that is past the offset, the line is the one before
    auto it = std::ranges::upper_bound(line_starts, offset);
    auto row = static_cast<uint32_t>(it - line_starts.begin());
    auto col = offset - line_starts[row - 1];

    return {row, col};
}

auto FileStore::add_file(std::string_view path) -> FileId {
    auto full_path = to_absolute_path(path).string();

    auto id = find_file_by_path(full_path);
    if (id.is_valid()) return id;

    auto contents = read_entire_file(full_path);
    if (!contents) return {};

    return add_file_and_contents_nocheck(path, full_path, *contents, false);
}

auto FileStore::add_file_and_contents(std::string_view path,
                                      std::string_view contents) -> FileId {
    auto full_path = to_absolute_path(path).string();

    auto id = find_file_by_path(full_path);
    if (id.is_valid()) return id;

    return add_file_and_contents_nocheck(path, full_path, contents, true);
}

auto FileStore::get_file_by_id(FileId id) const -> std::optional<File> {
    if (id.value() < files.size()) return files.at(id.value());
    return std::nullopt;
}

auto FileStore::find_file_by_path(std::string_view full_path) const -> FileId {
    auto it = std::ranges::find_if(
        files, [&](File const &f) { return f.full_path == full_path; });
    if (it == files.end()) return {};

    return it->id;
}

auto FileStore::read_entire_file(std::string const &path)
    -> std::optional<std::string_view> {
    std::unique_ptr<FILE, void (*)(FILE *)> f = {fopen(path.c_str(), "rb"),
                                                 [](auto f) { fclose(f); }};
    if (!f) return std::nullopt;

    if (fseek(f.get(), 0, SEEK_END) != 0) return std::nullopt;
    auto len = ftell(f.get());
    if (len < 0) return std::nullopt;

    fseek(f.get(), 0, SEEK_SET);

    auto s = big_arena.alloc_size<std::string_view::value_type>(len);
    if (static_cast<decltype(len)>(fread(
            s.data(), sizeof(std::string_view::value_type), len, f.get())) !=
        len)
        return std::nullopt;

    return std::string_view{s.data(), s.size()};
}

auto FileStore::add_file_and_contents_nocheck(std::string_view path,
                                              std::string_view full_path,
                                              std::string_view contents,
                                              bool copy_contents) -> FileId {
    auto id = FileId::from_raw_data(files.size());

    std::vector<uint32_t> starts{0};
    for (uint32_t i = 0; i < contents.size(); i++) {
        if (contents[i] == '\n') starts.push_back(i + 1);
    }

    auto f = File{
        .id = id,
        .original_path = small_arena.alloc_string_view(path),
        .full_path = small_arena.alloc_string_view(full_path),
        .contents = copy_contents ? big_arena.alloc_string_view(contents)
                                  : contents,
        .line_starts = small_arena.alloc<uint32_t>(starts),
    };

    files.push_back(f);

    return id;
}

// ============================================================================

void to_json(nlohmann::json &j, FileId const &id) { j = id.value(); }

}  // namespace fuse

auto fmt::formatter<fuse::FileId>::format(fuse::FileId const &p,
                                          format_context     &ctx) const
    -> format_context::iterator {
    return fmt::format_to(ctx.out(), "FileId({})", p.value());
}
