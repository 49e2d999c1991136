#include <fmt/format.h>

#include <cstdio>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "argparser.hpp"
#include "audit.hpp"
#include "error-reporter.hpp"
#include "errors.hpp"
#include "file-store.hpp"
#include "merge.hpp"
#include "report.hpp"
#include "utils.hpp"

namespace {

auto run_merge(pyfuse::Args const& args) -> int {
    auto fs = fuse::FileStore{};
    auto er = fuse::ErrorReporter{&fs, stderr, args.error_format};

    if (!std::filesystem::is_directory(args.root)) {
        fmt::print(stderr, "error: project root is not a directory: {}\n",
                   args.root);
        return 1;
    }

    fuse::MergeResult result;
    try {
        result = fuse::merge_project(fs, args.program, args.root, args.merge,
                                     stderr);
    } catch (fuse::MergeError const& e) {
        er.report_merge_error(e);
        return 1;
    } catch (std::runtime_error const& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }

    if (!fuse::write_file(result.output.string(), result.source)) {
        fmt::print(stderr, "error: failed to write output file: {}\n",
                   result.output.string());
        return 1;
    }

    if (args.merge.verbose.has_exe()) {
        fmt::print(stderr, "wrote {} ({}B)\n", result.output.string(),
                   result.source.size());
    }

    if (!result.verified()) {
        fuse::print_report(stderr, *result.report);
        return 2;
    }

    return 0;
}

auto run_audit(pyfuse::Args const& args) -> int {
    auto contents = fuse::read_entire_file(args.program);
    if (!contents) {
        fmt::print(stderr, "error: failed to read file: {}\n", args.program);
        return 1;
    }

    fuse::Auditor auditor;
    auto          passed = auditor.audit(*contents, args.program);
    auto const&   report = auditor.get_report();

    if (args.report_format == pyfuse::ReportFormat::Json) {
        nlohmann::json j = report;
        fmt::print("{}\n", j.dump(2));
        return passed ? 0 : 1;
    }

    auto fs = fuse::FileStore{};
    auto fileid = fs.add_file_and_contents(args.program, *contents);
    auto er = fuse::ErrorReporter{&fs, stdout, args.error_format};
    er.report_audit(fileid, report);

    if (args.error_format == fuse::ErrorReporterFormat::Pretty)
        fuse::print_summary(stdout, report);

    return passed ? 0 : 1;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    auto args = pyfuse::argparse(argc, argv);
    if (args.merge.verbose.has_exe()) fmt::print(stderr, "args: {}\n", args);

    switch (args.command) {
        case pyfuse::Command::Merge: return run_merge(args);
        case pyfuse::Command::Audit: return run_audit(args);
    }

    return 1;
}
