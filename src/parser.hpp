#pragma once

#include <span>
#include <string_view>

#include "ast.hpp"
#include "file-store.hpp"
#include "tokenizer.hpp"

namespace fuse {

/// Parse the tokens of a whole file into `ast`, returning its `Module` node.
/// Throws `ParseError` for anything that is not valid in the supported subset
/// of the language (`match` statements included).
auto parse_into_ast(std::span<Token const> tokens, std::string_view source,
                    FileId fileid, ast::Ast& ast) -> ast::NodeId;

/// Tokenize and parse `source`.
auto parse_source(std::string_view source, FileId fileid, ast::Ast& ast)
    -> ast::NodeId;

}  // namespace fuse
