#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "ast.hpp"
#include "file-store.hpp"
#include "merge.hpp"

namespace fuse::tests {

/// A directory under the system temporary directory. It is removed with all
/// of its contents when destroyed.
class TempProject {
public:
    TempProject();
    ~TempProject();

    TempProject(TempProject const&) = delete;
    TempProject(TempProject&&) = delete;
    auto operator=(TempProject const&) -> TempProject& = delete;
    auto operator=(TempProject&&) -> TempProject& = delete;

    /// Write `contents` to `relpath`, creating parent directories as needed.
    auto write(std::string_view relpath, std::string_view contents)
        -> std::filesystem::path;

    [[nodiscard]] auto path(std::string_view relpath) const
        -> std::filesystem::path {
        return dir / relpath;
    }

    [[nodiscard]] auto root() const -> std::filesystem::path const& {
        return dir;
    }

    /// Merge the project starting at `entry`. Nothing is written to disk.
    [[nodiscard]] auto merge(std::string_view entry,
                             MergeOptions const& options = {}) const
        -> MergeResult;

private:
    std::filesystem::path dir;
};

/// A single in-memory file, tokenized and parsed.
struct Parsed {
    explicit Parsed(std::string_view source);

    Parsed(Parsed const&) = delete;
    Parsed(Parsed&&) = delete;
    auto operator=(Parsed const&) -> Parsed& = delete;
    auto operator=(Parsed&&) -> Parsed& = delete;
    ~Parsed() = default;

    [[nodiscard]] auto stmt(size_t idx) const -> ast::NodeId {
        return ast.child(root, idx);
    }

    [[nodiscard]] auto text(ast::NodeId id) const -> std::string_view {
        return ast.get(id).span.str(source);
    }

    FileStore        fs;
    FileId           fileid;
    std::string_view source;
    ast::Ast         ast;
    ast::NodeId      root;
};

/// Number of times `needle` appears in `haystack`.
[[nodiscard]] auto count(std::string_view haystack, std::string_view needle)
    -> size_t;

/// Does `first` appear before `second` in `haystack`. Both must be present.
[[nodiscard]] auto appears_before(std::string_view haystack,
                                  std::string_view first,
                                  std::string_view second) -> bool;

}  // namespace fuse::tests
