#include "error-reporter.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <libassert/assert.hpp>
#include <nlohmann/json.hpp>
#include <span>
#include <string_view>

namespace fuse {

[[nodiscard]] constexpr auto find_linestart(std::string_view source,
                                            uint32_t         begin) -> Span {
    uint32_t line_start{};
    auto     line_end = static_cast<uint32_t>(source.length());

    begin = std::min(begin, line_end);
    for (auto i = begin; i > 0; i--) {
        if (source[i - 1] == '\n') {
            line_start = i;
            break;
        }
    }

    for (auto i = begin; i < source.length(); i++) {
        if (source[i] == '\n') {
            line_end = i;
            break;
        }
    }

    return {.begin = line_start, .end = line_end};
}

void ErrorReporter::vreport_error(Location const& s, fmt::string_view fmt,
                                  fmt::format_args args) {
    error_count++;
    report(s, "error", error_style, fmt, args);
}

void ErrorReporter::vreport_warn(Location const& s, fmt::string_view fmt,
                                 fmt::format_args args) {
    report(s, "warn", warn_style, fmt, args);
}

void ErrorReporter::vreport_note(Location const& s, fmt::string_view fmt,
                                 fmt::format_args args) {
    report(s, "note", note_style, fmt, args, 0);
}

void ErrorReporter::report_merge_error(MergeError const& e) {
    auto locs = e.get_locations();
    if (locs.empty()) {
        error_count++;
        fmt::print(out, "error: {}: {}\n", e.get_kind(), e.get_message());
        return;
    }

    report_error(locs[0], "{}: {}", e.get_kind(), e.get_message());
    for (auto const& loc : locs.subspan(1)) {
        report_note(loc, "also involved in this {}", e.get_kind());
    }
}

void ErrorReporter::report_audit(FileId fileid, Report const& report) {
    for (auto const& f : report.get_errors()) report_finding(fileid, f);
    for (auto const& f : report.get_warnings()) report_finding(fileid, f);
}

void ErrorReporter::report_finding(FileId fileid, Finding const& f) {
    auto file = fs->get_file_by_id(fileid);
    ASSERT(file.has_value(), "finding points to unknown file");

    auto const& starts = file->line_starts;
    auto        line_at = [&](uint32_t line) -> Location {
        uint32_t begin{};
        if (!starts.empty())
            begin = starts[std::clamp<size_t>(line, 1, starts.size()) - 1];

        return {.fileid = fileid,
                .span = find_linestart(file->contents, begin)};
    };

    auto is_error = f.severity == Severity::Error;
    if (f.lines.empty()) {
        if (is_error) error_count++;
        fmt::print(out, "{}: {}: {}\n", is_error ? "error" : "warn", f.kind,
                   f.message);
        return;
    }

    auto first = line_at(f.lines.front());
    if (is_error) {
        report_error(first, "{}: {}", f.kind, f.message);
    } else {
        report_warn(first, "{}: {}", f.kind, f.message);
    }

    for (auto line : std::span{f.lines}.subspan(1)) {
        report_note(line_at(line), "also involved in this {}", f.kind);
    }
}

void ErrorReporter::report(Location const& s, std::string_view prefix,
                           fmt::text_style color, fmt::string_view fmt,
                           fmt::format_args args, uint32_t context) {
    ASSERT(s.span.begin <= s.span.end);

    auto file = fs->get_file_by_id(s.fileid);
    ASSERT(file.has_value(), "location points to unknown file");

    auto message = fmt::vformat(fmt, args);
    switch (format) {
        case ErrorReporterFormat::Pretty:
            report_pretty(*file, s.span, prefix, color, message, context);
            break;
        case ErrorReporterFormat::Json:
            report_json(*file, s.span, prefix, message);
            break;
    }
}

void ErrorReporter::report_pretty(FileStore::File const& file, Span s,
                                  std::string_view prefix,
                                  fmt::text_style color,
                                  std::string_view message, uint32_t context) {
    std::string_view source = file.contents;
    auto [row, col] = file.rowcol_of(s.begin);

    fmt::print(out, "{}:{}:{}: ", file.original_path, row, col);

    auto tty = isatty(fileno(out)) != 0;
    if (tty) {
        fmt::print(out, color, "{}", prefix);
        fmt::print(out, ": ");
    } else {
        fmt::print(out, "{}: ", prefix);
    }

    fmt::print(out, "{}\n", message);

    auto [ls, le] = find_linestart(source, s.begin);

    // print `context` lines from before the line with the error
    if (context > 0 && ls > 0) {
        auto [pls, ple] = find_linestart(source, ls - 1);
        fmt::print(out, "  {:04} | {}\n", row - 1,
                   source.substr(pls, ple - pls));
    }

    if (tty) {
        fmt::print(out, color, ">");
        fmt::print(out, " {:04} | {}\n", row, source.substr(ls, le - ls));
    } else {
        fmt::print(out, "> {:04} | {}\n", row, source.substr(ls, le - ls));
    }

    auto carets = std::max<uint32_t>(1, std::min(s.end, le) - s.begin);
    if (tty) {
        fmt::print(out, "{0: <{1}}", "", 2 + 4 + 3 + s.begin - ls);
        fmt::print(out, color, "{0:^<{1}}", "", carets);
    } else {
        fmt::print(out, "{0: <{1}}{0:^<{2}}", "", 2 + 4 + 3 + s.begin - ls,
                   carets);
    }

    fmt::print(out, "\n");

    if (context > 0 && le < source.size()) {
        auto [nls, nle] = find_linestart(source, le + 1);
        fmt::print(out, "  {:04} | {}\n", row + 1,
                   source.substr(nls, nle - nls));
    }
}

void ErrorReporter::report_json(FileStore::File const& file, Span s,
                                std::string_view prefix,
                                std::string_view message) {
    auto [row, col] = file.rowcol_of(s.begin);

    nlohmann::json j = {
        {"severity",                  prefix},
        {    "file", std::string{file.original_path}},
        {     "row",                     row},
        {     "col",                     col},
        { "message",                 message},
    };

    fmt::print(out, "{}\n", j.dump());
}

}  // namespace fuse
