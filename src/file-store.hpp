#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arena.hpp"
#include "macros.hpp"

namespace fuse {

/// A unique identifier for a file. Used by every `Location` as a lightweight
/// way to find the path and contents of a source file.
class FileId {
    static constexpr auto const INVALID_DATA = 0xFFFF'FFFF;

    constexpr explicit FileId(uint32_t data) : data{data} {}

public:
    /// Default initialize to invalid.
    constexpr FileId() = default;

    // create a handle with the given value
    static constexpr auto from_raw_data(uint32_t raw_data) -> FileId {
        return FileId{raw_data};
    }

    constexpr auto operator==(FileId const &o) const -> bool = default;

    /// Get the internal data. Make sure to use it correctly.
    [[nodiscard]] constexpr auto value() const -> uint32_t { return data; }

    [[nodiscard]] constexpr auto is_valid() const -> bool {
        return data != INVALID_DATA;
    }

    [[nodiscard]] constexpr auto is_invalid() const -> bool {
        return !is_valid();
    }

private:
    uint32_t data{INVALID_DATA};
};

class FileStore {
public:
    struct File {
        FileId           id;
        std::string_view original_path;
        std::string_view full_path;
        std::string_view contents;

        // offset of the first byte of each line
        std::span<uint32_t const> line_starts;

        // 1-based line of the given byte offset.
        [[nodiscard]] auto line_of(uint32_t offset) const -> uint32_t;

        // 1-based line and 0-based column of the given byte offset.
        [[nodiscard]] auto rowcol_of(uint32_t offset) const
            -> std::pair<uint32_t, uint32_t>;
    };

    FileStore() = default;

    // add a file to the store. Its contents are read from the filesystem. In
    // case the read fails, an invalid `FileId` is returned. In case the file
    // has already been added to the store, it is returned directly instead.
    [[nodiscard]] auto add_file(std::string_view path) -> FileId;

    // add a file and its contents to the store. In case the file has already
    // been added to the store, it is returned directly instead.
    [[nodiscard]] auto add_file_and_contents(std::string_view path,
                                             std::string_view contents)
        -> FileId;

    // get a file by id
    [[nodiscard]] auto get_file_by_id(FileId id) const -> std::optional<File>;

    // find a file in the store given the full path.
    [[nodiscard]] auto find_file_by_path(std::string_view full_path) const
        -> FileId;

    [[nodiscard]] constexpr auto size() const -> size_t {
        return files.size();
    }

    [[nodiscard]] constexpr auto bytes_used() const -> size_t {
        return small_arena.bytes_used() + big_arena.bytes_used();
    }

private:
    // read the contents of a file into the `big_arena`.
    [[nodiscard]] auto read_entire_file(std::string const &full_path)
        -> std::optional<std::string_view>;

    // add a file to the store without checking that id is present
    [[nodiscard]] auto add_file_and_contents_nocheck(std::string_view path,
                                                     std::string_view full_path,
                                                     std::string_view contents,
                                                     bool copy_contents)
        -> FileId;

private:
    // list of all files, indexable by `FileId`
    std::vector<File> files;

    // This arena stores small data, like the filepaths and line tables.
    mem::Arena small_arena;
    // This arena stores large data, like the contents of files.
    mem::Arena big_arena;
};

// ============================================================================

void to_json(nlohmann::json &j, FileId const &id);

}  // namespace fuse

// ============================================================================

define_formatter_from_string_view(fuse::FileId);
define_hash_from_value(fuse::FileId);
