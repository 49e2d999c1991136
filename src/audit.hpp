#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "ast.hpp"
#include "catalog.hpp"
#include "file-store.hpp"
#include "report.hpp"

namespace fuse {

/// What a pattern check gets to look at: one parsed and cataloged file.
struct AuditContext {
    ast::Ast const&        ast;
    Catalog const&         catalog;
    FileStore::File const& file;
    ast::NodeId            root;

    [[nodiscard]] auto line_of(ast::NodeId node) const -> uint32_t {
        return file.line_of(ast.get(node).span.begin);
    }
};

/// A whole-file check run after the symbol table and reference stages.
/// Checks are independent of each other.
class PatternCheck {
public:
    PatternCheck() = default;
    PatternCheck(PatternCheck const&) = delete;
    PatternCheck(PatternCheck&&) = delete;
    auto operator=(PatternCheck const&) -> PatternCheck& = delete;
    auto operator=(PatternCheck&&) -> PatternCheck& = delete;
    virtual ~PatternCheck() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
    virtual void run(AuditContext const& ctx, Report& report) const = 0;
};

/// More than one top-level `if __name__ == "__main__":`, an error.
class MultipleEntryBlocksCheck : public PatternCheck {
public:
    [[nodiscard]] auto name() const -> std::string_view override {
        return "multiple-entry-blocks";
    }

    void run(AuditContext const& ctx, Report& report) const override;
};

/// `from . import x`, a warning.
class RelativeImportCheck : public PatternCheck {
public:
    [[nodiscard]] auto name() const -> std::string_view override {
        return "relative-import";
    }

    void run(AuditContext const& ctx, Report& report) const override;
};

/// Imports nested in an `if`, `while` or `try` outside of any function, a
/// warning.
class ConditionalImportCheck : public PatternCheck {
public:
    [[nodiscard]] auto name() const -> std::string_view override {
        return "conditional-import";
    }

    void run(AuditContext const& ctx, Report& report) const override;
};

/// Validates a single file: top-level duplicates, references that resolve to
/// nothing and the pattern checks. Never throws for problems in the file, all
/// of them end up in the report.
class Auditor {
public:
    /// Create an auditor with the default pattern checks.
    Auditor();

    /// Run every stage over `source`. Returns true when there are no errors.
    auto audit(std::string_view source, std::string_view display_path)
        -> bool;

    /// The report of the last call to `audit`.
    [[nodiscard]] auto get_report() const -> Report const&;

    void add_check(std::unique_ptr<PatternCheck> check) {
        checks.push_back(std::move(check));
    }

private:
    void check_duplicates(AuditContext const& ctx, Report& report) const;
    void check_references(AuditContext const& ctx, Report& report) const;

private:
    std::vector<std::unique_ptr<PatternCheck>> checks;
    std::optional<Report>                      report;
};

}  // namespace fuse
