#include "file-store.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <utility>

#include "test-helpers.hpp"

using namespace fuse;
using namespace fuse::tests;

// NOLINTBEGIN(readability-function-cognitive-complexity)

TEST_CASE("in-memory files", "[file-store]") {
    FileStore fs;

    auto id = fs.add_file_and_contents("a.py", "first\nsecond\n\nfourth");
    REQUIRE(id.is_valid());
    REQUIRE(fs.size() == 1);

    auto file = fs.get_file_by_id(id);
    REQUIRE(file.has_value());
    REQUIRE(file->contents == "first\nsecond\n\nfourth");
    REQUIRE(file->original_path == "a.py");

    SECTION("adding the same path again gives the same file") {
        auto again = fs.add_file_and_contents("a.py", "ignored");
        REQUIRE(again == id);
        REQUIRE(fs.size() == 1);
    }

    SECTION("lines and columns") {
        REQUIRE(file->line_of(0) == 1);
        REQUIRE(file->line_of(5) == 1);
        REQUIRE(file->line_of(6) == 2);
        REQUIRE(file->line_of(13) == 3);
        REQUIRE(file->rowcol_of(16) == std::pair<uint32_t, uint32_t>{4, 2});
    }

    SECTION("storage grows with every file") {
        auto before = fs.bytes_used();
        REQUIRE(before > 0);

        auto other = fs.add_file_and_contents("b.py", "x = 1\n");
        REQUIRE(other.is_valid());
        REQUIRE(fs.bytes_used() > before);
    }

    SECTION("unknown ids") {
        REQUIRE_FALSE(fs.get_file_by_id(FileId{}).has_value());
        REQUIRE_FALSE(fs.get_file_by_id(FileId::from_raw_data(7)).has_value());
    }
}

TEST_CASE("files on disk", "[file-store]") {
    TempProject project;
    auto        path = project.write("pkg/mod.py", "x = 1\n");

    FileStore fs;
    auto      id = fs.add_file(path.string());
    REQUIRE(id.is_valid());
    REQUIRE(fs.get_file_by_id(id)->contents == "x = 1\n");
    REQUIRE(fs.find_file_by_path(path.string()) == id);

    SECTION("missing files") {
        REQUIRE(fs.add_file(project.path("missing.py").string()).is_invalid());
    }
}

// NOLINTEND(readability-function-cognitive-complexity)
