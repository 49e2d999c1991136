#include "report.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <nlohmann/json.hpp>

namespace fuse {

namespace {

auto normalized(std::vector<uint32_t> lines) -> std::vector<uint32_t> {
    std::ranges::sort(lines);
    auto [first, last] = std::ranges::unique(lines);
    lines.erase(first, last);
    return lines;
}

void print_findings(FILE* out, std::span<Finding const> findings) {
    for (auto const& f : findings) {
        fmt::print(out, "  [{}] line{} {}: {}\n", f.kind,
                   f.lines.size() == 1 ? "" : "s", fmt::join(f.lines, ", "),
                   f.message);
    }
}

}  // namespace

void Report::add_error(FindingKind kind, std::string message,
                       std::vector<uint32_t> lines) {
    errors.push_back({.kind = kind,
                      .severity = Severity::Error,
                      .message = std::move(message),
                      .lines = normalized(std::move(lines))});
}

void Report::add_warning(FindingKind kind, std::string message,
                         std::vector<uint32_t> lines) {
    warnings.push_back({.kind = kind,
                        .severity = Severity::Warning,
                        .message = std::move(message),
                        .lines = normalized(std::move(lines))});
}

auto Report::has(FindingKind kind) const -> bool {
    auto is = [&](Finding const& f) { return f.kind == kind; };
    return std::ranges::any_of(errors, is) || std::ranges::any_of(warnings, is);
}

void print_summary(FILE* out, Report const& report) {
    auto errors = report.get_errors().size();
    auto warnings = report.get_warnings().size();

    fmt::print(out, "audit of {}: {} ({} error{}, {} warning{})\n",
               report.get_path(), report.passed() ? "passed" : "FAILED",
               errors, errors == 1 ? "" : "s", warnings,
               warnings == 1 ? "" : "s");
}

void print_report(FILE* out, Report const& report) {
    auto errors = report.get_errors();
    auto warnings = report.get_warnings();

    print_summary(out, report);

    if (!errors.empty()) {
        fmt::print(out, "errors:\n");
        print_findings(out, errors);
    }

    if (!warnings.empty()) {
        fmt::print(out, "warnings:\n");
        print_findings(out, warnings);
    }
}

auto format_as(Severity s) -> std::string_view {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
    }

    return "?";
}

void to_json(nlohmann::json& j, Finding const& f) {
    j = nlohmann::json{
        {    "kind",                 f.kind},
        {"severity", format_as(f.severity)},
        { "message",              f.message},
        {   "lines",                f.lines},
    };
}

void to_json(nlohmann::json& j, Report const& r) {
    j = nlohmann::json{
        {    "path",                   r.get_path()},
        {  "passed",                     r.passed()},
        {  "errors",   std::vector<Finding>{r.get_errors().begin(),
                                          r.get_errors().end()}},
        {"warnings", std::vector<Finding>{r.get_warnings().begin(),
                                          r.get_warnings().end()}},
    };
}

}  // namespace fuse

auto fmt::formatter<fuse::Severity>::format(fuse::Severity const& p,
                                            format_context&       ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(fuse::format_as(p), ctx);
}
