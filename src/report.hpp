#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <cstdio>
#include <nlohmann/json_fwd.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "macros.hpp"

namespace fuse {

enum class Severity : uint8_t {
    /// The file must not be trusted.
    Error,
    /// Informational, does not fail the audit.
    Warning,
};

/// One problem found by the audit. Errors and warnings have the same shape.
struct Finding {
    FindingKind kind;
    Severity    severity;
    std::string message;

    // 1-based, sorted
    std::vector<uint32_t> lines;
};

/// Everything the audit found in one file.
class Report {
public:
    explicit Report(std::string path) : path{std::move(path)} {}

    void add_error(FindingKind kind, std::string message,
                   std::vector<uint32_t> lines);
    void add_warning(FindingKind kind, std::string message,
                     std::vector<uint32_t> lines);

    [[nodiscard]] auto get_path() const -> std::string const& { return path; }

    [[nodiscard]] auto get_errors() const -> std::span<Finding const> {
        return errors;
    }

    [[nodiscard]] auto get_warnings() const -> std::span<Finding const> {
        return warnings;
    }

    [[nodiscard]] auto passed() const -> bool { return errors.empty(); }

    /// Does the report have at least one finding of the given kind.
    [[nodiscard]] auto has(FindingKind kind) const -> bool;

private:
    std::string          path;
    std::vector<Finding> errors;
    std::vector<Finding> warnings;
};

/// Render the report as text, errors under one heading and warnings under
/// another.
void print_report(FILE* out, Report const& report);

/// The first line of `print_report`: path, verdict and counts.
void print_summary(FILE* out, Report const& report);

auto format_as(Severity s) -> std::string_view;

void to_json(nlohmann::json& j, Finding const& f);
void to_json(nlohmann::json& j, Report const& r);

}  // namespace fuse

define_formatter_from_string_view(fuse::Severity);
