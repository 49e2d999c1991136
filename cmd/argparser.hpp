#pragma once

#include <fmt/format.h>

#include <string>

#include "error-reporter.hpp"
#include "macros.hpp"
#include "merge.hpp"

namespace pyfuse {

enum class Command { Merge, Audit };

enum class ReportFormat { Text, Json };

struct Args {
    Command command = Command::Merge;

    // the entry script for `merge`, the file to check for `audit`
    std::string program;
    std::string root;

    fuse::MergeOptions merge{};
    ReportFormat       report_format = ReportFormat::Text;

    fuse::ErrorReporterFormat error_format = fuse::ErrorReporterFormat::Pretty;
};

[[nodiscard]] auto argparse(int argc, char** argv) -> Args;

// ============================================================================

auto format_as(Command command) -> std::string_view;

}  // namespace pyfuse

// ============================================================================

define_formatter_from_string_view(pyfuse::Command);
define_formatter_from_string_view(pyfuse::Args);
