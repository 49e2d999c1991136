#pragma once

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdint>
#include <cstdio>
#include <string_view>

#include "errors.hpp"
#include "file-store.hpp"
#include "location.hpp"
#include "report.hpp"

namespace fuse {

enum class ErrorReporterFormat {
    /// Message with the offending source line and a caret underline.
    Pretty,
    /// One JSON object per line.
    Json,
};

/// Prints diagnostics that point into files of a `FileStore`.
class ErrorReporter {
    static constexpr auto const error_style = fmt::fg(fmt::color::red);
    static constexpr auto const warn_style = fmt::fg(fmt::color::yellow);
    static constexpr auto const note_style = fmt::fg(fmt::color::cyan);

public:
    constexpr ErrorReporter(FileStore const* fs, FILE* out,
                            ErrorReporterFormat format =
                                ErrorReporterFormat::Pretty)
        : fs{fs}, out{out}, format{format} {}

    template <typename... T>
    void report_error(Location const& s, fmt::format_string<T...> fmt,
                      T&&... args) {
        vreport_error(s, fmt, fmt::make_format_args(args...));
    }

    template <typename... T>
    void report_warn(Location const& s, fmt::format_string<T...> fmt,
                     T&&... args) {
        vreport_warn(s, fmt, fmt::make_format_args(args...));
    }

    template <typename... T>
    void report_note(Location const& s, fmt::format_string<T...> fmt,
                     T&&... args) {
        vreport_note(s, fmt, fmt::make_format_args(args...));
    }

    void vreport_error(Location const& s, fmt::string_view fmt,
                       fmt::format_args args);
    void vreport_warn(Location const& s, fmt::string_view fmt,
                      fmt::format_args args);
    void vreport_note(Location const& s, fmt::string_view fmt,
                      fmt::format_args args);

    /// Report a merge failure: the first location gets the error message,
    /// every other one is shown as a note.
    void report_merge_error(MergeError const& e);

    /// Report every finding of an audit of `fileid`, errors first. A finding
    /// points at its first line, the others are shown as notes.
    void report_audit(FileId fileid, Report const& report);

    // -----------------------------------------------------------------------

    [[nodiscard]] constexpr auto had_error() const -> bool {
        return error_count > 0;
    }

    [[nodiscard]] constexpr auto get_error_count() const -> uint32_t {
        return error_count;
    }

private:
    void report_finding(FileId fileid, Finding const& f);

    void report(Location const& s, std::string_view prefix,
                fmt::text_style color, fmt::string_view fmt,
                fmt::format_args args, uint32_t context = 1);

    void report_pretty(FileStore::File const& file, Span s,
                       std::string_view prefix, fmt::text_style color,
                       std::string_view message, uint32_t context);

    void report_json(FileStore::File const& file, Span s,
                     std::string_view prefix, std::string_view message);

private:
    // we use this to get contents and file information
    FileStore const* fs;

    FILE*               out;
    ErrorReporterFormat format;
    uint32_t            error_count{};
};

}  // namespace fuse
