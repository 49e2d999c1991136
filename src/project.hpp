#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ast.hpp"
#include "catalog.hpp"
#include "file-store.hpp"
#include "resolver.hpp"

namespace fuse {

/// One source file of the project.
struct Module {
    uint32_t index;

    // dotted name, `pkg.mod` for `pkg/mod.py` and `pkg` for `pkg/__init__.py`
    std::string name;
    // path relative to the directory it was found in, `pkg/mod.py`
    std::string relpath;

    FileId      fileid;
    ast::NodeId root;
    bool        is_package;
    bool        is_entry;
};

enum class TargetKind : uint8_t { External, Module, Symbol };

/// What an import alias denotes once re-exports are followed.
struct ImportTarget {
    TargetKind kind;

    // the dotted name of the module for `Module`
    std::string module;
    // the symbol for `Symbol`, never an import alias. For `External` the
    // alias that imports it from outside of the project.
    SymbolId symbol;
};

/// What a `Name` use denotes after following import aliases and attribute
/// chains through modules. `node` is the outermost node that denotes
/// `symbol`, `pkg.mod.f` for a use of `pkg` that ends at `f`.
struct RefTarget {
    SymbolId    symbol;
    ast::NodeId node;
};

/// All modules reachable from an entry script, parsed into one `Ast` and
/// cataloged together.
class Project {
public:
    Project(FileStore& fs, std::filesystem::path root, FILE* trace = nullptr);

    Project(Project const&) = delete;
    Project(Project&&) = delete;
    auto operator=(Project const&) -> Project& = delete;
    auto operator=(Project&&) -> Project& = delete;

    /// Load the entry script and, recursively, every internal module it
    /// imports. Throws `ParseError` for files that can not be parsed.
    void load(std::filesystem::path const& entry);

    /// Resolve every name and import. Throws `UnsupportedConstructError`,
    /// `DuplicateDefinitionError` and `UnresolvedReferenceError`.
    void link();

    [[nodiscard]] auto get_ast() const -> ast::Ast const& { return ast; }
    [[nodiscard]] auto get_catalog() const -> Catalog const& {
        return catalog;
    }
    [[nodiscard]] auto get_catalog() -> Catalog& { return catalog; }
    [[nodiscard]] auto get_resolver() const -> Resolver const& {
        return *resolver;
    }
    [[nodiscard]] auto get_file_store() const -> FileStore const& {
        return *fs;
    }

    [[nodiscard]] auto get_modules() const -> std::span<Module const> {
        return modules;
    }

    [[nodiscard]] auto get_module(uint32_t idx) const -> Module const& {
        return modules.at(idx);
    }

    [[nodiscard]] auto get_entry() const -> Module const& {
        return modules.at(entry);
    }

    /// Modules in the order they finish loading: every module comes after the
    /// modules it imports.
    [[nodiscard]] auto get_load_order() const -> std::span<uint32_t const> {
        return load_order;
    }

    /// The module with the given dotted name, if it was loaded.
    [[nodiscard]] auto find_module(std::string_view name) const
        -> std::optional<uint32_t>;

    /// What an import alias symbol finally denotes.
    [[nodiscard]] auto alias_target(SymbolId alias) -> ImportTarget const&;

    /// The target of a `Name` use. Invalid symbol for builtins.
    [[nodiscard]] auto ref_target(ast::NodeId name) const -> RefTarget;

    /// Does the import alias (an `ImportAlias` node) import from a module of
    /// the project.
    [[nodiscard]] auto is_internal_alias(ast::NodeId alias) const -> bool;

    /// The absolute dotted module of an `ImportFrom` statement, with the
    /// relative levels resolved. Empty when there are too many levels.
    [[nodiscard]] auto absolute_module(uint32_t module,
                                       ast::NodeId import_from) const
        -> std::string;

    [[nodiscard]] auto location_of(ast::NodeId node) const -> Location;

private:
    auto load_module(std::string name, std::filesystem::path const& path,
                     std::string relpath, bool is_package, bool is_entry)
        -> uint32_t;
    void load_imports(uint32_t module);
    void load_by_name(std::string_view name);

    struct Found {
        std::filesystem::path path;
        std::string           relpath;
        bool                  is_package;
    };

    [[nodiscard]] auto search(std::string_view name) const
        -> std::optional<Found>;
    [[nodiscard]] auto is_internal(std::string_view name) const -> bool;

    [[nodiscard]] auto module_of_node(ast::NodeId node) const -> uint32_t;

    void check_wildcards();
    void check_duplicates();
    void check_unresolved();
    void check_dynamic_imports();
    void link_references();

    auto compute_alias_target(SymbolId alias) -> ImportTarget;
    auto member_of(std::string const& module, std::string_view name,
                   ast::NodeId use) -> ImportTarget;

private:
    FileStore*            fs;
    std::filesystem::path root;
    std::filesystem::path entry_dir;
    FILE*                 trace;

    ast::Ast                ast;
    Catalog                 catalog;
    std::optional<Resolver> resolver;

    std::vector<Module>                       modules;
    std::vector<uint32_t>                     load_order;
    std::unordered_map<std::string, uint32_t> by_name;
    uint32_t                                  entry{};

    // modules that were looked up, `nullopt` for externals
    mutable std::unordered_map<std::string, std::optional<Found>> searched;

    std::unordered_map<SymbolId, ImportTarget> alias_targets;
    std::vector<SymbolId>                      following;

    std::vector<RefTarget> ref_targets;
};

}  // namespace fuse
