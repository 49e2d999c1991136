#include "test-helpers.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "fmt/format.h"
#include "parser.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace fuse::tests {

TempProject::TempProject() {
    auto pattern = (fs::temp_directory_path() / "pyfuse-tests-XXXXXX").string();
    if (mkdtemp(pattern.data()) == nullptr)
        throw std::runtime_error{"failed to create a temporary directory"};

    dir = pattern;
}

TempProject::~TempProject() {
    std::error_code ec;
    fs::remove_all(dir, ec);
}

auto TempProject::write(std::string_view relpath, std::string_view contents)
    -> fs::path {
    auto p = dir / relpath;
    fs::create_directories(p.parent_path());

    if (!write_file(p.string(), contents))
        throw std::runtime_error{
            fmt::format("failed to write {}", p.string())};

    return p;
}

auto TempProject::merge(std::string_view entry,
                        MergeOptions const& options) const -> MergeResult {
    FileStore fs;
    return merge_project(fs, dir / entry, dir, options, stderr);
}

Parsed::Parsed(std::string_view src) {
    fileid = fs.add_file_and_contents(":memory:", src);
    source = fs.get_file_by_id(fileid)->contents;
    root = parse_source(source, fileid, ast);
}

auto count(std::string_view haystack, std::string_view needle) -> size_t {
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size()))
        n++;

    return n;
}

auto appears_before(std::string_view haystack, std::string_view first,
                    std::string_view second) -> bool {
    auto a = haystack.find(first);
    auto b = haystack.find(second);
    return a != std::string_view::npos && b != std::string_view::npos && a < b;
}

}  // namespace fuse::tests
