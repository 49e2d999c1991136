#include "ast-node.hpp"

namespace fuse::ast {

auto format_as(NodeKind kind) -> std::string_view {
    std::string_view name = "?";

    switch (kind) {
        case NodeKind::Module: name = "Module"; break;
        case NodeKind::FunctionDef: name = "FunctionDef"; break;
        case NodeKind::ClassDef: name = "ClassDef"; break;
        case NodeKind::Decorators: name = "Decorators"; break;
        case NodeKind::Params: name = "Params"; break;
        case NodeKind::Param: name = "Param"; break;
        case NodeKind::Arguments: name = "Arguments"; break;
        case NodeKind::Block: name = "Block"; break;
        case NodeKind::If: name = "If"; break;
        case NodeKind::While: name = "While"; break;
        case NodeKind::For: name = "For"; break;
        case NodeKind::Try: name = "Try"; break;
        case NodeKind::ExceptHandler: name = "ExceptHandler"; break;
        case NodeKind::With: name = "With"; break;
        case NodeKind::WithItem: name = "WithItem"; break;
        case NodeKind::Return: name = "Return"; break;
        case NodeKind::Raise: name = "Raise"; break;
        case NodeKind::Pass: name = "Pass"; break;
        case NodeKind::Break: name = "Break"; break;
        case NodeKind::Continue: name = "Continue"; break;
        case NodeKind::Global: name = "Global"; break;
        case NodeKind::Nonlocal: name = "Nonlocal"; break;
        case NodeKind::Delete: name = "Delete"; break;
        case NodeKind::Assert: name = "Assert"; break;
        case NodeKind::ExprStmt: name = "ExprStmt"; break;
        case NodeKind::Assign: name = "Assign"; break;
        case NodeKind::AugAssign: name = "AugAssign"; break;
        case NodeKind::AnnAssign: name = "AnnAssign"; break;
        case NodeKind::Import: name = "Import"; break;
        case NodeKind::ImportFrom: name = "ImportFrom"; break;
        case NodeKind::ImportAlias: name = "ImportAlias"; break;
        case NodeKind::Name: name = "Name"; break;
        case NodeKind::Attribute: name = "Attribute"; break;
        case NodeKind::Subscript: name = "Subscript"; break;
        case NodeKind::Slice: name = "Slice"; break;
        case NodeKind::Call: name = "Call"; break;
        case NodeKind::BinOp: name = "BinOp"; break;
        case NodeKind::UnaryOp: name = "UnaryOp"; break;
        case NodeKind::BoolOp: name = "BoolOp"; break;
        case NodeKind::Compare: name = "Compare"; break;
        case NodeKind::IfExp: name = "IfExp"; break;
        case NodeKind::Lambda: name = "Lambda"; break;
        case NodeKind::NamedExpr: name = "NamedExpr"; break;
        case NodeKind::Await: name = "Await"; break;
        case NodeKind::Yield: name = "Yield"; break;
        case NodeKind::YieldFrom: name = "YieldFrom"; break;
        case NodeKind::Tuple: name = "Tuple"; break;
        case NodeKind::List: name = "List"; break;
        case NodeKind::Set: name = "Set"; break;
        case NodeKind::Dict: name = "Dict"; break;
        case NodeKind::ListComp: name = "ListComp"; break;
        case NodeKind::SetComp: name = "SetComp"; break;
        case NodeKind::GeneratorExp: name = "GeneratorExp"; break;
        case NodeKind::DictComp: name = "DictComp"; break;
        case NodeKind::Comprehension: name = "Comprehension"; break;
        case NodeKind::Starred: name = "Starred"; break;
        case NodeKind::DoubleStarred: name = "DoubleStarred"; break;
        case NodeKind::Keyword: name = "Keyword"; break;
        case NodeKind::Constant: name = "Constant"; break;
        case NodeKind::Str: name = "Str"; break;
        case NodeKind::ForwardRef: name = "ForwardRef"; break;
    }

    return name;
}

}  // namespace fuse::ast

auto fmt::formatter<fuse::ast::NodeKind>::format(fuse::ast::NodeKind const& p,
                                                 format_context& ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(fuse::ast::format_as(p), ctx);
}
