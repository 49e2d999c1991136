#pragma once

#include <fmt/format.h>

#include <exception>
#include <nlohmann/json_fwd.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "location.hpp"
#include "macros.hpp"

namespace fuse {

/// Every problem the merge and audit pipelines know how to report.
enum class FindingKind {
    /// Input is not syntactically valid.
    ParseFailure,
    /// Wildcard imports, dynamic imports, module objects used as values.
    UnsupportedConstruct,
    /// The same bare name defined twice in one scope.
    DuplicateDefinition,
    /// A name or validated attribute chain that resolves to nothing.
    UnresolvedReference,
    /// Definitions that depend on each other.
    CircularDependency,
    /// More than one top-level `if __name__ == "__main__":` block.
    MultipleEntryBlocks,
    /// `from . import x`, likely broken once the file is moved.
    RelativeImport,
    /// Import nested inside a runtime conditional.
    ConditionalImport,
};

/// Base of all errors that abort a merge. Each error carries the locations in
/// the original sources that caused it.
class MergeError : public std::exception {
public:
    MergeError(FindingKind kind, std::string message,
               std::vector<Location> locations)
        : kind{kind},
          message{std::move(message)},
          locations{std::move(locations)} {}

    [[nodiscard]] auto what() const noexcept -> char const* override {
        return message.c_str();
    }

    [[nodiscard]] constexpr auto get_kind() const -> FindingKind {
        return kind;
    }

    [[nodiscard]] auto get_message() const -> std::string const& {
        return message;
    }

    [[nodiscard]] auto get_locations() const -> std::span<Location const> {
        return locations;
    }

private:
    FindingKind           kind;
    std::string           message;
    std::vector<Location> locations;
};

class ParseError : public MergeError {
public:
    ParseError(std::string message, Location loc)
        : MergeError{FindingKind::ParseFailure, std::move(message), {loc}} {}
};

class UnsupportedConstructError : public MergeError {
public:
    UnsupportedConstructError(std::string message, Location loc)
        : MergeError{FindingKind::UnsupportedConstruct, std::move(message),
                     {loc}} {}
};

class DuplicateDefinitionError : public MergeError {
public:
    DuplicateDefinitionError(std::string message,
                             std::vector<Location> locations)
        : MergeError{FindingKind::DuplicateDefinition, std::move(message),
                     std::move(locations)} {}
};

class UnresolvedReferenceError : public MergeError {
public:
    UnresolvedReferenceError(std::string message,
                             std::vector<Location> locations)
        : MergeError{FindingKind::UnresolvedReference, std::move(message),
                     std::move(locations)} {}
};

/// Raised by the orderer, `symbols` has the names of every definition that is
/// part of the cycle, in dependency order.
class CircularDependencyError : public MergeError {
public:
    CircularDependencyError(std::vector<std::string> symbols,
                            std::vector<Location>    locations);

    [[nodiscard]] auto get_symbols() const -> std::span<std::string const> {
        return symbols;
    }

private:
    std::vector<std::string> symbols;
};

// ============================================================================

auto format_as(FindingKind kind) -> std::string_view;

void to_json(nlohmann::json& j, FindingKind const& kind);

}  // namespace fuse

define_formatter_from_string_view(fuse::FindingKind);
