#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

#include "file-store.hpp"
#include "macros.hpp"
#include "report.hpp"

namespace fuse {

struct DumpStep {
    enum Step {
        None = 0,
        Tokens = 1 << 0,
        Ast = 1 << 1,
        Graph = 1 << 2,
        Renames = 1 << 3,
        Order = 1 << 4,
    };

#define define_with(_T, _name, _enum_case)                  \
    [[nodiscard]] constexpr auto with_##_name() const->_T { \
        return {static_cast<Step>(value | _enum_case)};     \
    }

#define define_has(_name, _enum_case)                        \
    [[nodiscard]] constexpr auto has_##_name() const->bool { \
        return (value & _enum_case) != 0;                    \
    }

#define define_parts(_T, _name, _enum_case) \
    define_with(_T, _name, _enum_case) define_has(_name, _enum_case)

    define_parts(DumpStep, tokens, Tokens);
    define_parts(DumpStep, ast, Ast);
    define_parts(DumpStep, graph, Graph);
    define_parts(DumpStep, renames, Renames);
    define_parts(DumpStep, order, Order);

    [[nodiscard]] constexpr auto has(Step step) const -> bool {
        return (value & step) != 0;
    }

    Step value{None};
};

struct VerboseStep {
    enum Step {
        None = 0,
        Exe = 1 << 0,
        Load = 1 << 1,
        Graph = 1 << 2,
        Order = 1 << 3,
    };

    define_parts(VerboseStep, exe, Exe);
    define_parts(VerboseStep, load, Load);
    define_parts(VerboseStep, graph, Graph);
    define_parts(VerboseStep, order, Order);

#undef define_with
#undef define_has
#undef define_parts

    [[nodiscard]] constexpr auto has(Step step) const -> bool {
        return (value & step) != 0;
    }

    Step value{None};
};

struct MergeOptions {
    // audit the merged file before trusting it
    bool verify = true;

    VerboseStep verbose{};
    DumpStep    dump{};

    // defaults to `<entry-stem>_merged.py` beside the entry script
    std::filesystem::path output;
};

struct MergeResult {
    std::filesystem::path output;
    std::string           source;

    // present when the merged file was verified
    std::optional<Report> report;

    [[nodiscard]] auto verified() const -> bool {
        return !report || report->passed();
    }
};

/// `<entry-stem>_merged.py` in the directory of the entry script.
[[nodiscard]] auto default_output_path(std::filesystem::path const& entry)
    -> std::filesystem::path;

/// Merge the entry script and every project module it needs into one file.
/// The file is not written, see `MergeResult::output`. Throws `MergeError`
/// when the project can not be merged, and `std::runtime_error` when a file
/// can not be read. Verbose output and dumps go to `log`.
[[nodiscard]] auto merge_project(FileStore&                   fs,
                                 std::filesystem::path const& entry,
                                 std::filesystem::path const& root,
                                 MergeOptions const& options, FILE* log)
    -> MergeResult;

auto format_as(DumpStep::Step step) -> std::string_view;
auto format_as(VerboseStep::Step step) -> std::string_view;

}  // namespace fuse

define_formatter_from_string_view(fuse::DumpStep);
define_formatter_from_string_view(fuse::VerboseStep);
