#include "parser.hpp"

#include <cstddef>
#include <libassert/assert.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ast.hpp"
#include "errors.hpp"
#include "location.hpp"
#include "tokenizer.hpp"

namespace fuse {

using ast::NodeId;
using ast::NodeKind;

namespace {

constexpr auto is_quote(char c) -> bool { return c == '\'' || c == '"'; }

/// Split a single string literal into its prefix, quotes and body.
struct StringLiteral {
    std::string_view prefix;
    uint32_t         quote_len;
    Span             body;

    [[nodiscard]] constexpr auto has_prefix(char c) const -> bool {
        return prefix.find(c) != std::string_view::npos ||
               prefix.find(static_cast<char>(c - 'a' + 'A')) !=
                   std::string_view::npos;
    }

    [[nodiscard]] constexpr auto is_fstring() const -> bool {
        return has_prefix('f');
    }

    [[nodiscard]] constexpr auto is_bytes() const -> bool {
        return has_prefix('b');
    }

    [[nodiscard]] constexpr auto is_raw() const -> bool {
        return has_prefix('r');
    }
};

constexpr auto split_literal(std::string_view source, Span span)
    -> StringLiteral {
    auto     text = span.str(source);
    uint32_t p = 0;
    while (p < text.size() && !is_quote(text[p])) p++;

    ASSERT(p < text.size());
    uint32_t q = 1;
    if (text.size() - p >= 6 && text[p + 1] == text[p] &&
        text[p + 2] == text[p]) {
        q = 3;
    }

    return {
        .prefix = text.substr(0, p),
        .quote_len = q,
        .body = {.begin = span.begin + p + q, .end = span.end - q},
    };
}

}  // namespace

class Parser {
    std::span<Token const> tokens;
    size_t                 current_token{};

    std::string_view source;
    FileId           fileid;
    ast::Ast&        ast;

public:
    Parser(std::span<Token const> tokens, std::string_view source,
           FileId fileid, ast::Ast& ast)
        : tokens{tokens}, source{source}, fileid{fileid}, ast{ast} {}

    auto parse_module() -> NodeId {
        std::vector<NodeId> body;
        while (!is_at_end()) parse_statement(body);

        return ast.new_node(
            NodeKind::Module,
            {.begin = 0, .end = static_cast<uint32_t>(source.size())}, body);
    }

    // parse a free standing expression, must consume all tokens
    auto parse_standalone_expression(bool allow_tuple) -> NodeId {
        auto expr = allow_tuple ? parse_star_expressions() : parse_expression();
        if (!is_at_end()) {
            error(span(), fmt::format("unexpected {} after expression",
                                      describe(peek())));
        }

        return expr;
    }

    // ------------------------------------------------------------------------
    // Statements

    void parse_statement(std::vector<NodeId>& out) {
        if (check(TokenType::Indent)) error(span(), "unexpected indent");
        if (check(TokenType::Dedent)) error(span(), "unexpected unindent");

        if (check(TokenType::At) || check("def") || check("class") ||
            (check("async") && check_next("def"))) {
            out.push_back(parse_definition());
            return;
        }

        if (check("if")) {
            out.push_back(parse_if());
            return;
        }

        if (check("while")) {
            out.push_back(parse_while());
            return;
        }

        if (check("for") || (check("async") && check_next("for"))) {
            out.push_back(parse_for());
            return;
        }

        if (check("try")) {
            out.push_back(parse_try());
            return;
        }

        if (check("with") || (check("async") && check_next("with"))) {
            out.push_back(parse_with());
            return;
        }

        if (looks_like_match_statement()) {
            error(span(), "match statements are not supported");
        }

        parse_simple_line(out);
    }

    void parse_simple_line(std::vector<NodeId>& out) {
        do {
            out.push_back(parse_simple_statement());
        } while (match(TokenType::Semi) && !check(TokenType::Newline));

        consume(TokenType::Newline, "newline");
    }

    auto parse_block() -> NodeId {
        consume(TokenType::Colon, "':'");

        std::vector<NodeId> body;
        if (match(TokenType::Newline)) {
            if (!match(TokenType::Indent)) {
                error(span(), "expected an indented block");
            }

            while (!match(TokenType::Dedent)) {
                if (is_at_end()) error(span(), "unexpected end of file");
                parse_statement(body);
            }
        } else {
            parse_simple_line(body);
        }

        ASSERT(!body.empty());
        auto s = ast.get(body.front())
                     .span.extend(ast.get(body.back()).span);
        return ast.new_node(NodeKind::Block, s, body);
    }

    auto parse_definition() -> NodeId {
        auto start = span();

        std::vector<NodeId> decorators;
        while (match(TokenType::At)) {
            decorators.push_back(parse_expression());
            consume(TokenType::Newline, "newline after decorator");
        }

        auto decorators_span = decorators.empty()
                                   ? Span{.begin = start.begin,
                                          .end = start.begin}
                                   : ast.get(decorators.front())
                                         .span.extend(
                                             ast.get(decorators.back()).span);
        auto decos =
            ast.new_node(NodeKind::Decorators, decorators_span, decorators);

        if (check("class")) return parse_class(start, decos);

        uint32_t flags = match("async") ? ast::ASYNC : 0;
        consume("def");

        auto name = parse_name(ast::ExprContext::Store);

        auto params_start = span();
        consume(TokenType::Lparen, "'('");
        auto params = parse_params(TokenType::Rparen, true);
        consume(TokenType::Rparen, "')'");
        auto params_node = ast.new_node(NodeKind::Params,
                                        params_start.extend(prev_span()),
                                        params);

        auto returns = NodeId::invalid();
        if (match(TokenType::Arrow)) returns = parse_annotation();

        auto body = parse_block();

        return ast.new_node(
            NodeKind::FunctionDef, start.extend(ast.get(body).span),
            {name, decos, params_node, returns, body}, ast.get(name).str,
            flags);
    }

    auto parse_class(Span start, NodeId decorators) -> NodeId {
        consume("class");
        auto name = parse_name(ast::ExprContext::Store);

        NodeId args;
        if (check(TokenType::Lparen)) {
            args = parse_call_arguments();
        } else {
            auto s = prev_span();
            args = ast.new_node(NodeKind::Arguments,
                                {.begin = s.end, .end = s.end});
        }

        auto body = parse_block();

        return ast.new_node(NodeKind::ClassDef,
                            start.extend(ast.get(body).span),
                            {name, decorators, args, body}, ast.get(name).str);
    }

    // NOLINTNEXTLINE(readability-function-cognitive-complexity)
    auto parse_params(TokenType end, bool annotations) -> std::vector<NodeId> {
        std::vector<NodeId> params;
        auto                after_star = false;

        while (!check(end)) {
            if (match(TokenType::Slash)) {
                if (!match(TokenType::Comma)) break;
                continue;
            }

            auto kind = after_star ? ast::ParamKind::KwOnly
                                   : ast::ParamKind::Normal;
            if (match(TokenType::Star)) {
                after_star = true;

                // bare `*` marks the start of keyword-only parameters
                if (check(TokenType::Comma) || check(end)) {
                    if (!match(TokenType::Comma)) break;
                    continue;
                }

                kind = ast::ParamKind::VarArgs;
            } else if (match(TokenType::StarStar)) {
                kind = ast::ParamKind::VarKw;
            }

            auto name_tok = peek();
            consume_name();

            auto annotation = NodeId::invalid();
            if (annotations && match(TokenType::Colon)) {
                annotation = parse_annotation();
            }

            auto default_value = NodeId::invalid();
            if (match(TokenType::Equal)) default_value = parse_expression();

            params.push_back(ast.new_node(
                NodeKind::Param, name_tok.span, {annotation, default_value},
                name_tok.span.str(source), static_cast<uint32_t>(kind)));

            if (!match(TokenType::Comma)) break;
        }

        return params;
    }

    auto parse_if() -> NodeId {
        auto start = span();
        advance();  // `if` or `elif`

        auto test = parse_expression();
        auto body = parse_block();
        auto end = ast.get(body).span;

        auto orelse = NodeId::invalid();
        if (check("elif")) {
            orelse = parse_if();
            end = ast.get(orelse).span;
        } else if (match("else")) {
            orelse = parse_block();
            end = ast.get(orelse).span;
        }

        return ast.new_node(NodeKind::If, start.extend(end),
                            {test, body, orelse});
    }

    auto parse_while() -> NodeId {
        auto start = span();
        consume("while");

        auto test = parse_expression();
        auto body = parse_block();
        auto orelse = match("else") ? parse_block() : NodeId::invalid();

        auto end = ast.get(orelse.is_valid() ? orelse : body).span;
        return ast.new_node(NodeKind::While, start.extend(end),
                            {test, body, orelse});
    }

    auto parse_for() -> NodeId {
        auto     start = span();
        uint32_t flags = match("async") ? ast::ASYNC : 0;
        consume("for");

        auto target = parse_target_list();
        mark_store(target);

        consume("in");
        auto iter = parse_star_expressions();
        auto body = parse_block();
        auto orelse = match("else") ? parse_block() : NodeId::invalid();

        auto end = ast.get(orelse.is_valid() ? orelse : body).span;
        return ast.new_node(NodeKind::For, start.extend(end),
                            {target, iter, body, orelse}, {}, flags);
    }

    auto parse_try() -> NodeId {
        auto start = span();
        consume("try");

        auto body = parse_block();
        auto end = ast.get(body).span;

        std::vector<NodeId> handlers;
        while (check("except")) {
            auto handler_start = span();
            advance();
            (void)match(TokenType::Star);

            auto type = NodeId::invalid();
            auto name = NodeId::invalid();
            if (!check(TokenType::Colon)) {
                type = parse_expression();
                if (match("as")) name = parse_name(ast::ExprContext::Store);
            }

            auto handler_body = parse_block();
            end = ast.get(handler_body).span;
            handlers.push_back(ast.new_node(NodeKind::ExceptHandler,
                                            handler_start.extend(end),
                                            {type, name, handler_body}));
        }

        auto orelse = NodeId::invalid();
        if (!handlers.empty() && match("else")) {
            orelse = parse_block();
            end = ast.get(orelse).span;
        }

        auto finalbody = NodeId::invalid();
        if (match("finally")) {
            finalbody = parse_block();
            end = ast.get(finalbody).span;
        }

        if (handlers.empty() && finalbody.is_invalid()) {
            error(span(), "expected 'except' or 'finally' block");
        }

        std::vector<NodeId> children{body, orelse, finalbody};
        children.insert(children.end(), handlers.begin(), handlers.end());

        return ast.new_node(NodeKind::Try, start.extend(end), children);
    }

    auto parse_with() -> NodeId {
        auto     start = span();
        uint32_t flags = match("async") ? ast::ASYNC : 0;
        consume("with");

        std::vector<NodeId> items;
        if (check(TokenType::Lparen) && parenthesized_with_items()) {
            advance();
            while (!check(TokenType::Rparen)) {
                items.push_back(parse_with_item());
                if (!match(TokenType::Comma)) break;
            }

            consume(TokenType::Rparen, "')'");
        } else {
            do {
                items.push_back(parse_with_item());
            } while (match(TokenType::Comma));
        }

        auto body = parse_block();

        std::vector<NodeId> children{body};
        children.insert(children.end(), items.begin(), items.end());

        return ast.new_node(NodeKind::With, start.extend(ast.get(body).span),
                            children, {}, flags);
    }

    auto parse_with_item() -> NodeId {
        auto start = span();
        auto context = parse_expression();

        auto target = NodeId::invalid();
        if (match("as")) {
            target = parse_target();
            mark_store(target);
        }

        return ast.new_node(NodeKind::WithItem, start.extend(prev_span()),
                            {context, target});
    }

    // `with (a as b, c):` has its items in parenthesis, which is the case when
    // the closing parenthesis is followed by the colon that starts the block.
    [[nodiscard]] auto parenthesized_with_items() const -> bool {
        size_t depth = 0;
        for (auto i = current_token; i < tokens.size(); i++) {
            auto const& t = tokens[i];
            if (t.is_open()) depth++;
            if (t.is_close() && --depth == 0) {
                return i + 1 < tokens.size() &&
                       tokens[i + 1].is(TokenType::Colon);
            }
        }

        return false;
    }

    // `match` is a soft keyword, only treat it as a statement when the line
    // looks like one.
    [[nodiscard]] auto looks_like_match_statement() const -> bool {
        if (!check("match")) return false;

        auto const& next = tokens[current_token + 1];
        switch (next.type) {
            case TokenType::Equal:
            case TokenType::Dot:
            case TokenType::ColonEqual:
            case TokenType::AugAssign:
            case TokenType::Comma:
            case TokenType::Colon:
            case TokenType::Semi:
            case TokenType::Newline:
            case TokenType::Eof: return false;
            default: break;
        }

        for (auto i = current_token + 1; i < tokens.size(); i++) {
            if (tokens[i].is(TokenType::Newline) || tokens[i].is_eof()) {
                return tokens[i - 1].is(TokenType::Colon);
            }
        }

        return false;
    }

    // NOLINTNEXTLINE(readability-function-cognitive-complexity)
    auto parse_simple_statement() -> NodeId {
        auto start = span();

        if (match("pass")) return ast.new_node(NodeKind::Pass, start);
        if (match("break")) return ast.new_node(NodeKind::Break, start);
        if (match("continue")) return ast.new_node(NodeKind::Continue, start);

        if (match("return")) {
            auto value = can_start_expression() ? parse_star_expressions()
                                                : NodeId::invalid();
            return ast.new_node(NodeKind::Return, start.extend(prev_span()),
                                {value});
        }

        if (match("raise")) {
            auto exc = NodeId::invalid();
            auto cause = NodeId::invalid();
            if (can_start_expression()) {
                exc = parse_expression();
                if (match("from")) cause = parse_expression();
            }

            return ast.new_node(NodeKind::Raise, start.extend(prev_span()),
                                {exc, cause});
        }

        if (check("global") || check("nonlocal")) {
            auto kind =
                check("global") ? NodeKind::Global : NodeKind::Nonlocal;
            advance();

            std::vector<NodeId> names;
            do {
                names.push_back(parse_name(ast::ExprContext::Load));
            } while (match(TokenType::Comma));

            return ast.new_node(kind, start.extend(prev_span()), names);
        }

        if (match("del")) {
            std::vector<NodeId> targets;
            do {
                auto target = parse_target();
                check_target(target);
                ast.set_ctx(target, ast::ExprContext::Del);
                targets.push_back(target);
            } while (match(TokenType::Comma) && can_start_expression());

            return ast.new_node(NodeKind::Delete, start.extend(prev_span()),
                                targets);
        }

        if (match("assert")) {
            auto test = parse_expression();
            auto msg =
                match(TokenType::Comma) ? parse_expression() : NodeId::invalid();

            return ast.new_node(NodeKind::Assert, start.extend(prev_span()),
                                {test, msg});
        }

        if (check("import")) return parse_import();
        if (check("from")) return parse_import_from();

        return parse_expression_statement();
    }

    auto parse_import() -> NodeId {
        auto start = span();
        consume("import");

        std::vector<NodeId> aliases;
        do {
            auto alias_start = span();
            auto name = parse_dotted_name();

            auto asname = NodeId::invalid();
            if (match("as")) asname = parse_name(ast::ExprContext::Store);

            aliases.push_back(ast.new_node(NodeKind::ImportAlias,
                                           alias_start.extend(prev_span()),
                                           {asname}, name));
        } while (match(TokenType::Comma));

        return ast.new_node(NodeKind::Import, start.extend(prev_span()),
                            aliases);
    }

    auto parse_import_from() -> NodeId {
        auto start = span();
        consume("from");

        uint32_t level = 0;
        while (true) {
            if (match(TokenType::Dot)) {
                level += 1;
            } else if (match(TokenType::DotDotDot)) {
                level += 3;
            } else {
                break;
            }
        }

        std::string_view module;
        if (!check("import")) {
            module = parse_dotted_name();
        } else if (level == 0) {
            error(span(), "expected module name");
        }

        consume("import");

        std::vector<NodeId> aliases;
        if (check(TokenType::Star)) {
            auto s = span();
            advance();
            aliases.push_back(ast.new_node(NodeKind::ImportAlias, s,
                                           {NodeId::invalid()}, "*"));
        } else {
            auto parens = match(TokenType::Lparen);
            do {
                if (parens && check(TokenType::Rparen)) break;

                auto alias_start = span();
                auto name_tok = peek();
                consume_name();

                auto asname = NodeId::invalid();
                if (match("as")) asname = parse_name(ast::ExprContext::Store);

                aliases.push_back(ast.new_node(
                    NodeKind::ImportAlias, alias_start.extend(prev_span()),
                    {asname}, name_tok.span.str(source)));
            } while (match(TokenType::Comma));

            if (parens) consume(TokenType::Rparen, "')'");
        }

        return ast.new_node(NodeKind::ImportFrom, start.extend(prev_span()),
                            aliases, module, level);
    }

    auto parse_dotted_name() -> std::string_view {
        auto first = peek();
        consume_name();

        std::string name{first.span.str(source)};
        while (match(TokenType::Dot)) {
            auto part = peek();
            consume_name();

            name += '.';
            name += part.span.str(source);
        }

        return ast.dupe_string(name);
    }

    auto parse_expression_statement() -> NodeId {
        auto start = span();
        auto first = check("yield") ? parse_yield() : parse_star_expressions();

        if (match(TokenType::Colon)) {
            check_single_target(first);
            mark_store(first);

            auto annotation = parse_annotation();
            auto value = NodeId::invalid();
            if (match(TokenType::Equal)) value = parse_assign_value();

            return ast.new_node(NodeKind::AnnAssign, start.extend(prev_span()),
                                {first, annotation, value});
        }

        if (check(TokenType::AugAssign)) {
            auto op = span().str(source);
            advance();

            check_single_target(first);
            mark_store(first);

            auto value = parse_assign_value();
            return ast.new_node(NodeKind::AugAssign, start.extend(prev_span()),
                                {first, value}, op);
        }

        if (check(TokenType::Equal)) {
            std::vector<NodeId> exprs{first};
            while (match(TokenType::Equal)) {
                exprs.push_back(parse_assign_value());
            }

            for (size_t i = 0; i + 1 < exprs.size(); i++) mark_store(exprs[i]);

            return ast.new_node(NodeKind::Assign, start.extend(prev_span()),
                                exprs);
        }

        return ast.new_node(NodeKind::ExprStmt, start.extend(prev_span()),
                            {first});
    }

    auto parse_assign_value() -> NodeId {
        if (check("yield")) return parse_yield();
        return parse_star_expressions();
    }

    // ------------------------------------------------------------------------
    // Assignment targets

    void check_single_target(NodeId target) {
        auto const& node = ast.get(target);
        if (!node.is_oneof(NodeKind::Name, NodeKind::Attribute,
                           NodeKind::Subscript)) {
            error(node.span, "illegal target for annotation or augmented "
                             "assignment");
        }
    }

    void check_target(NodeId target) {
        auto const& node = ast.get(target);
        switch (node.kind) {
            case NodeKind::Name:
            case NodeKind::Attribute:
            case NodeKind::Subscript: return;

            case NodeKind::Tuple:
            case NodeKind::List:
            case NodeKind::Starred:
                for (auto child : ast.children(target)) check_target(child);
                return;

            default: error(node.span, "cannot assign to expression");
        }
    }

    void mark_store(NodeId target) {
        check_target(target);
        ast.set_ctx(target, ast::ExprContext::Store);
    }

    // a single target, without comparisons so that `in` is left alone
    auto parse_target() -> NodeId {
        if (check(TokenType::Star)) {
            auto start = span();
            advance();

            auto value = parse_bitor();
            return ast.new_node(NodeKind::Starred, start.extend(prev_span()),
                                {value});
        }

        return parse_bitor();
    }

    auto parse_target_list() -> NodeId {
        auto start = span();
        auto first = parse_target();
        if (!check(TokenType::Comma)) return first;

        std::vector<NodeId> elts{first};
        while (match(TokenType::Comma)) {
            if (check("in") || check(TokenType::Equal) || !can_start_expression())
                break;
            elts.push_back(parse_target());
        }

        return ast.new_node(NodeKind::Tuple, start.extend(prev_span()), elts);
    }

    // ------------------------------------------------------------------------
    // Expressions

    // expressions separated by commas, `*a` allowed
    auto parse_star_expressions() -> NodeId {
        auto start = span();
        auto first = parse_star_named_expression();
        if (!check(TokenType::Comma)) return first;

        std::vector<NodeId> elts{first};
        while (match(TokenType::Comma)) {
            if (!can_start_expression()) break;
            elts.push_back(parse_star_named_expression());
        }

        return ast.new_node(NodeKind::Tuple, start.extend(prev_span()), elts);
    }

    auto parse_star_named_expression() -> NodeId {
        if (check(TokenType::Star)) {
            auto start = span();
            advance();

            auto value = parse_bitor();
            return ast.new_node(NodeKind::Starred, start.extend(prev_span()),
                                {value});
        }

        return parse_expression();
    }

    auto parse_expression() -> NodeId {
        auto start = span();

        if (check(TokenType::Id) && check_next(TokenType::ColonEqual)) {
            auto target = parse_name(ast::ExprContext::Store);
            advance();

            auto value = parse_expression();
            return ast.new_node(NodeKind::NamedExpr, start.extend(prev_span()),
                                {target, value});
        }

        if (check("lambda")) return parse_lambda();

        auto body = parse_or();
        if (!match("if")) return body;

        auto test = parse_or();
        consume("else");
        auto orelse = parse_expression();

        return ast.new_node(NodeKind::IfExp, start.extend(prev_span()),
                            {body, test, orelse});
    }

    auto parse_annotation() -> NodeId {
        auto expr = parse_expression();
        auto const& node = ast.get(expr);

        if (node.kind != NodeKind::Str ||
            (node.flags & (ast::STR_FSTRING | ast::STR_BYTES |
                           ast::STR_CONCAT)) != 0) {
            return expr;
        }

        auto literal = split_literal(source, node.span);
        if (literal.body.size() == 0 ||
            literal.body.str(source).find('\\') != std::string_view::npos) {
            return expr;
        }

        // The string may be a forward reference, which is just an expression
        // in a string. When it does not parse it is left as a string.
        try {
            auto ref_tokens = tokenize_expression(source, literal.body, fileid);
            auto parser = Parser{ref_tokens, source, fileid, ast};
            auto inner = parser.parse_standalone_expression(false);

            return ast.new_node(NodeKind::ForwardRef, node.span, {inner});
        } catch (ParseError const&) {
            return expr;
        }
    }

    auto parse_lambda() -> NodeId {
        auto start = span();
        consume("lambda");

        auto params_start = span();
        auto params = parse_params(TokenType::Colon, false);
        auto params_node = ast.new_node(
            NodeKind::Params,
            {.begin = params_start.begin,
             .end = params.empty() ? params_start.begin : prev_span().end},
            params);

        consume(TokenType::Colon, "':'");
        auto body = parse_expression();

        return ast.new_node(NodeKind::Lambda, start.extend(prev_span()),
                            {params_node, body});
    }

    auto parse_yield() -> NodeId {
        auto start = span();
        consume("yield");

        if (match("from")) {
            auto value = parse_expression();
            return ast.new_node(NodeKind::YieldFrom, start.extend(prev_span()),
                                {value});
        }

        auto value = can_start_expression() ? parse_star_expressions()
                                            : NodeId::invalid();
        return ast.new_node(NodeKind::Yield, start.extend(prev_span()),
                            {value});
    }

    auto parse_or() -> NodeId { return parse_bool_op("or"); }

    auto parse_bool_op(std::string_view op) -> NodeId {
        auto start = span();
        auto first = op == "or" ? parse_bool_op("and") : parse_not();
        if (!check(op)) return first;

        std::vector<NodeId> values{first};
        while (match(op)) {
            values.push_back(op == "or" ? parse_bool_op("and") : parse_not());
        }

        return ast.new_node(NodeKind::BoolOp, start.extend(prev_span()),
                            values, op == "or" ? "or" : "and");
    }

    auto parse_not() -> NodeId {
        auto start = span();
        if (!match("not")) return parse_comparison();

        auto operand = parse_not();
        return ast.new_node(NodeKind::UnaryOp, start.extend(prev_span()),
                            {operand}, "not");
    }

    auto parse_comparison() -> NodeId {
        auto start = span();
        auto left = parse_bitor();

        std::vector<NodeId> children{left};
        std::string         ops;

        while (true) {
            std::string_view op;
            if (check_oneof(TokenType::EqualEqual, TokenType::BangEqual,
                            TokenType::Less, TokenType::LessEqual,
                            TokenType::Greater, TokenType::GreaterEqual)) {
                op = span().str(source);
                advance();
            } else if (check("in")) {
                op = "in";
                advance();
            } else if (check("not") && check_next("in")) {
                op = "not in";
                advance();
                advance();
            } else if (check("is")) {
                advance();
                op = match("not") ? "is not" : "is";
            } else {
                break;
            }

            if (!ops.empty()) ops += ',';
            ops += op;
            children.push_back(parse_bitor());
        }

        if (children.size() == 1) return left;

        return ast.new_node(NodeKind::Compare, start.extend(prev_span()),
                            children, ast.dupe_string(ops));
    }

    auto parse_binary(auto&& next, auto... ops) -> NodeId {
        auto start = span();
        auto lhs = next();

        while (check_oneof(ops...)) {
            auto op = span().str(source);
            advance();

            auto rhs = next();
            lhs = ast.new_node(NodeKind::BinOp, start.extend(prev_span()),
                               {lhs, rhs}, op);
        }

        return lhs;
    }

    auto parse_bitor() -> NodeId {
        return parse_binary([&] { return parse_bitxor(); }, TokenType::Pipe);
    }

    auto parse_bitxor() -> NodeId {
        return parse_binary([&] { return parse_bitand(); }, TokenType::Carrot);
    }

    auto parse_bitand() -> NodeId {
        return parse_binary([&] { return parse_shift(); },
                            TokenType::Ampersand);
    }

    auto parse_shift() -> NodeId {
        return parse_binary([&] { return parse_arith(); }, TokenType::LessLess,
                            TokenType::GreaterGreater);
    }

    auto parse_arith() -> NodeId {
        return parse_binary([&] { return parse_term(); }, TokenType::Plus,
                            TokenType::Minus);
    }

    auto parse_term() -> NodeId {
        return parse_binary([&] { return parse_factor(); }, TokenType::Star,
                            TokenType::Slash, TokenType::SlashSlash,
                            TokenType::Percent, TokenType::At);
    }

    auto parse_factor() -> NodeId {
        auto start = span();
        if (check_oneof(TokenType::Plus, TokenType::Minus, TokenType::Tilde)) {
            auto op = span().str(source);
            advance();

            auto operand = parse_factor();
            return ast.new_node(NodeKind::UnaryOp, start.extend(prev_span()),
                                {operand}, op);
        }

        return parse_power();
    }

    auto parse_power() -> NodeId {
        auto start = span();
        auto base = parse_await();
        if (!check(TokenType::StarStar)) return base;

        auto op = span().str(source);
        advance();

        auto exp = parse_factor();
        return ast.new_node(NodeKind::BinOp, start.extend(prev_span()),
                            {base, exp}, op);
    }

    auto parse_await() -> NodeId {
        auto start = span();
        if (!match("await")) return parse_primary();

        auto value = parse_primary();
        return ast.new_node(NodeKind::Await, start.extend(prev_span()),
                            {value});
    }

    auto parse_primary() -> NodeId {
        auto start = span();
        auto expr = parse_atom();

        while (true) {
            if (match(TokenType::Dot)) {
                auto attr = peek();
                consume_name();

                expr = ast.new_node(NodeKind::Attribute,
                                    start.extend(prev_span()), {expr},
                                    attr.span.str(source));
            } else if (check(TokenType::Lparen)) {
                auto args = parse_call_arguments();
                expr = ast.new_node(NodeKind::Call, start.extend(prev_span()),
                                    {expr, args});
            } else if (match(TokenType::Lbracket)) {
                auto slice = parse_slices();
                consume(TokenType::Rbracket, "']'");

                expr = ast.new_node(NodeKind::Subscript,
                                    start.extend(prev_span()), {expr, slice});
            } else {
                break;
            }
        }

        return expr;
    }

    auto parse_call_arguments() -> NodeId {
        auto start = span();
        consume(TokenType::Lparen, "'('");

        std::vector<NodeId> args;
        while (!check(TokenType::Rparen)) {
            auto arg_start = span();

            if (match(TokenType::StarStar)) {
                auto value = parse_expression();
                args.push_back(ast.new_node(NodeKind::DoubleStarred,
                                            arg_start.extend(prev_span()),
                                            {value}));
            } else if (check(TokenType::Id) && check_next(TokenType::Equal)) {
                auto name = span().str(source);
                advance();
                advance();

                auto value = parse_expression();
                args.push_back(ast.new_node(NodeKind::Keyword,
                                            arg_start.extend(prev_span()),
                                            {value}, name));
            } else {
                auto value = parse_star_named_expression();
                if (check("for") || check("async")) {
                    std::vector<NodeId> elts{value};
                    parse_generators(elts);
                    value = ast.new_node(NodeKind::GeneratorExp,
                                         arg_start.extend(prev_span()), elts);
                }

                args.push_back(value);
            }

            if (!match(TokenType::Comma)) break;
        }

        consume(TokenType::Rparen, "')'");
        return ast.new_node(NodeKind::Arguments, start.extend(prev_span()),
                            args);
    }

    auto parse_slices() -> NodeId {
        auto start = span();
        auto first = parse_slice();
        if (!check(TokenType::Comma)) return first;

        std::vector<NodeId> elts{first};
        while (match(TokenType::Comma)) {
            if (check(TokenType::Rbracket)) break;
            elts.push_back(parse_slice());
        }

        return ast.new_node(NodeKind::Tuple, start.extend(prev_span()), elts);
    }

    auto parse_slice() -> NodeId {
        auto start = span();

        auto lower = NodeId::invalid();
        if (!check(TokenType::Colon)) {
            lower = parse_star_named_expression();
            if (!check(TokenType::Colon)) return lower;
        }

        consume(TokenType::Colon, "':'");

        auto slice_end = [&] {
            return check_oneof(TokenType::Colon, TokenType::Comma,
                               TokenType::Rbracket);
        };

        auto upper = slice_end() ? NodeId::invalid() : parse_expression();
        auto step = NodeId::invalid();
        if (match(TokenType::Colon) && !slice_end()) step = parse_expression();

        return ast.new_node(NodeKind::Slice, start.extend(prev_span()),
                            {lower, upper, step});
    }

    // Parse the `for ... in ... if ...` clauses that follow the element of a
    // comprehension, appending them to `elts`.
    void parse_generators(std::vector<NodeId>& elts) {
        while (check("for") || (check("async") && check_next("for"))) {
            auto     gen_start = span();
            uint32_t flags = match("async") ? ast::ASYNC : 0;
            consume("for");

            auto target = parse_target_list();
            mark_store(target);

            consume("in");

            std::vector<NodeId> children{target, parse_or()};
            while (match("if")) children.push_back(parse_or());

            elts.push_back(ast.new_node(NodeKind::Comprehension,
                                        gen_start.extend(prev_span()),
                                        children, {}, flags));
        }
    }

    // NOLINTNEXTLINE(readability-function-cognitive-complexity)
    auto parse_atom() -> NodeId {
        auto start = span();
        auto tok = peek();

        switch (tok.type) {
            case TokenType::Number:
                advance();
                return ast.new_node(
                    NodeKind::Constant, start, {}, start.str(source),
                    static_cast<uint32_t>(ast::ConstantKind::Number));

            case TokenType::DotDotDot:
                advance();
                return ast.new_node(
                    NodeKind::Constant, start, {}, start.str(source),
                    static_cast<uint32_t>(ast::ConstantKind::Ellipsis));

            case TokenType::Str: return parse_strings();

            case TokenType::Lparen: return parse_paren();
            case TokenType::Lbracket: return parse_list();
            case TokenType::Lbrace: return parse_dict_or_set();

            case TokenType::Id: {
                auto text = tok.span.str(source);

                auto constant = [&](ast::ConstantKind kind) {
                    advance();
                    return ast.new_node(NodeKind::Constant, start, {}, text,
                                        static_cast<uint32_t>(kind));
                };

                if (text == "None") return constant(ast::ConstantKind::None);
                if (text == "True") return constant(ast::ConstantKind::True);
                if (text == "False") return constant(ast::ConstantKind::False);

                return parse_name(ast::ExprContext::Load);
            }

            default: break;
        }

        error(start, fmt::format("expected expression, but got {}",
                                 describe(tok)));
    }

    auto parse_paren() -> NodeId {
        auto start = span();
        consume(TokenType::Lparen, "'('");

        if (match(TokenType::Rparen)) {
            return ast.new_node(NodeKind::Tuple, start.extend(prev_span()));
        }

        if (check("yield")) {
            auto value = parse_yield();
            consume(TokenType::Rparen, "')'");
            return value;
        }

        auto first = parse_star_named_expression();
        if (check("for") || check("async")) {
            std::vector<NodeId> elts{first};
            parse_generators(elts);
            consume(TokenType::Rparen, "')'");

            return ast.new_node(NodeKind::GeneratorExp,
                                start.extend(prev_span()), elts);
        }

        if (!check(TokenType::Comma)) {
            consume(TokenType::Rparen, "')'");
            return first;
        }

        std::vector<NodeId> elts{first};
        while (match(TokenType::Comma)) {
            if (check(TokenType::Rparen)) break;
            elts.push_back(parse_star_named_expression());
        }

        consume(TokenType::Rparen, "')'");
        return ast.new_node(NodeKind::Tuple, start.extend(prev_span()), elts);
    }

    auto parse_list() -> NodeId {
        auto start = span();
        consume(TokenType::Lbracket, "'['");

        std::vector<NodeId> elts;
        if (!check(TokenType::Rbracket)) {
            elts.push_back(parse_star_named_expression());

            if (check("for") || check("async")) {
                parse_generators(elts);
                consume(TokenType::Rbracket, "']'");
                return ast.new_node(NodeKind::ListComp,
                                    start.extend(prev_span()), elts);
            }

            while (match(TokenType::Comma)) {
                if (check(TokenType::Rbracket)) break;
                elts.push_back(parse_star_named_expression());
            }
        }

        consume(TokenType::Rbracket, "']'");
        return ast.new_node(NodeKind::List, start.extend(prev_span()), elts);
    }

    // NOLINTNEXTLINE(readability-function-cognitive-complexity)
    auto parse_dict_or_set() -> NodeId {
        auto start = span();
        consume(TokenType::Lbrace, "'{'");

        if (match(TokenType::Rbrace)) {
            return ast.new_node(NodeKind::Dict, start.extend(prev_span()));
        }

        std::vector<NodeId> items;
        auto                is_dict = false;

        // first item decides between a dict and a set
        if (match(TokenType::StarStar)) {
            is_dict = true;
            items.push_back(NodeId::invalid());
            items.push_back(parse_bitor());
        } else {
            auto first = parse_star_named_expression();
            if (match(TokenType::Colon)) {
                is_dict = true;
                items.push_back(first);
                items.push_back(parse_expression());
            } else {
                items.push_back(first);
            }
        }

        if (check("for") || check("async")) {
            if (is_dict && items[0].is_invalid()) {
                error(span(), "dict unpacking cannot be used in dict "
                              "comprehension");
            }

            parse_generators(items);
            consume(TokenType::Rbrace, "'}'");

            return ast.new_node(is_dict ? NodeKind::DictComp
                                        : NodeKind::SetComp,
                                start.extend(prev_span()), items);
        }

        while (match(TokenType::Comma)) {
            if (check(TokenType::Rbrace)) break;

            if (!is_dict) {
                items.push_back(parse_star_named_expression());
                continue;
            }

            if (match(TokenType::StarStar)) {
                items.push_back(NodeId::invalid());
                items.push_back(parse_bitor());
                continue;
            }

            items.push_back(parse_expression());
            consume(TokenType::Colon, "':'");
            items.push_back(parse_expression());
        }

        consume(TokenType::Rbrace, "'}'");
        return ast.new_node(is_dict ? NodeKind::Dict : NodeKind::Set,
                            start.extend(prev_span()), items);
    }

    // ------------------------------------------------------------------------
    // Strings

    auto parse_strings() -> NodeId {
        auto start = span();

        uint32_t            flags = 0;
        size_t              count = 0;
        std::vector<NodeId> fields;

        while (check(TokenType::Str)) {
            auto tok = peek();
            advance();
            count++;

            auto literal = split_literal(source, tok.span);
            if (literal.is_bytes()) flags |= ast::STR_BYTES;
            if (literal.is_fstring()) {
                flags |= ast::STR_FSTRING;
                parse_fstring(literal, fields);
            }
        }

        if (count > 1) flags |= ast::STR_CONCAT;

        auto s = start.extend(prev_span());
        return ast.new_node(NodeKind::Str, s, fields, s.str(source), flags);
    }

    void parse_fstring(StringLiteral const& literal,
                       std::vector<NodeId>& fields) {
        auto i = literal.body.begin;
        auto limit = literal.body.end;

        while (i < limit) {
            auto c = source[i];
            if (c == '{') {
                if (i + 1 < limit && source[i + 1] == '{') {
                    i += 2;
                    continue;
                }

                i = parse_fstring_field(i + 1, limit, fields);
                continue;
            }

            if (c == '\\' && !literal.is_raw()) {
                i += 2;
                continue;
            }

            i++;
        }
    }

    // Parse a replacement field starting after its `{`, returning the offset
    // after the closing `}`.
    // NOLINTNEXTLINE(readability-function-cognitive-complexity)
    auto parse_fstring_field(uint32_t begin, uint32_t limit,
                             std::vector<NodeId>& fields) -> uint32_t {
        auto field_span = Span{.begin = begin - 1, .end = limit};

        uint32_t depth = 0;
        auto     i = begin;
        auto     expr_end = limit;

        while (i < limit) {
            auto c = source[i];

            if (is_quote(c)) {
                i++;
                while (i < limit && source[i] != c) i++;
                i++;
                continue;
            }

            if (c == '(' || c == '[' || c == '{') {
                depth++;
            } else if (c == ')' || c == ']' || c == '}') {
                if (depth == 0) {
                    if (c == '}') {
                        expr_end = i;
                        break;
                    }

                    error(field_span, "f-string: unmatched bracket");
                }

                depth--;
            } else if (depth == 0) {
                auto next = i + 1 < limit ? source[i + 1] : '\0';
                auto prev = i > begin ? source[i - 1] : '\0';

                if ((c == '!' && next != '=') || c == ':') {
                    expr_end = i;
                    break;
                }

                if (c == '=' && next != '=' && prev != '=' && prev != '!' &&
                    prev != '<' && prev != '>') {
                    expr_end = i;
                    break;
                }
            }

            i++;
        }

        if (expr_end == limit) error(field_span, "f-string: expecting '}'");

        auto range = Span{.begin = begin, .end = expr_end};
        auto field_tokens = tokenize_expression(source, range, fileid);
        if (field_tokens.size() == 1) {
            error(field_span, "f-string: empty expression not allowed");
        }

        auto parser = Parser{field_tokens, source, fileid, ast};
        fields.push_back(parser.parse_standalone_expression(true));

        // skip `=`, the conversion and the format spec
        i = expr_end;
        if (source[i] == '=') i++;
        while (i < limit && source[i] == ' ') i++;
        if (i < limit && source[i] == '!') i += 2;
        if (i < limit && source[i] == ':') {
            i++;
            while (i < limit && source[i] != '}') {
                if (source[i] == '{') {
                    i = parse_fstring_field(i + 1, limit, fields);
                    continue;
                }

                i++;
            }
        }

        if (i >= limit || source[i] != '}') {
            error(field_span, "f-string: expecting '}'");
        }

        return i + 1;
    }

    // ------------------------------------------------------------------------
    // Helpers

    auto parse_name(ast::ExprContext ctx) -> NodeId {
        auto tok = peek();
        consume_name();

        return ast.new_node(NodeKind::Name, tok.span, {},
                            tok.span.str(source), static_cast<uint32_t>(ctx));
    }

    void consume_name() {
        auto tok = peek();
        if (!tok.is_id() || is_reserved(tok.span.str(source))) {
            error(tok.span,
                  fmt::format("expected a name, but got {}", describe(tok)));
        }

        advance();
    }

    [[nodiscard]] auto can_start_expression() const -> bool {
        auto tok = peek();
        switch (tok.type) {
            case TokenType::Number:
            case TokenType::Str:
            case TokenType::Lparen:
            case TokenType::Lbracket:
            case TokenType::Lbrace:
            case TokenType::Minus:
            case TokenType::Plus:
            case TokenType::Tilde:
            case TokenType::Star:
            case TokenType::DotDotDot: return true;

            case TokenType::Id: {
                auto text = tok.span.str(source);
                return !is_reserved(text) || text == "None" ||
                       text == "True" || text == "False" || text == "not" ||
                       text == "lambda" || text == "await" || text == "yield";
            }

            default: return false;
        }
    }

    [[nodiscard]] auto describe(Token const& tok) const -> std::string {
        switch (tok.type) {
            case TokenType::Newline: return "newline";
            case TokenType::Indent: return "indent";
            case TokenType::Dedent: return "unindent";
            case TokenType::Eof: return "end of file";
            default: return fmt::format("'{}'", tok.span.str(source));
        }
    }

    [[noreturn]] void error(Span s, std::string message) const {
        throw ParseError{std::move(message), {.fileid = fileid, .span = s}};
    }

    void consume(TokenType tt, std::string_view what) {
        if (match(tt)) return;

        error(span(), fmt::format("expected {}, but got {}", what,
                                  describe(peek())));
    }

    void consume(std::string_view kw) {
        if (match(kw)) return;

        error(span(), fmt::format("expected '{}', but got {}", kw,
                                  describe(peek())));
    }

    [[nodiscard]] constexpr auto peek() const -> Token {
        return tokens[current_token];
    }

    [[nodiscard]] constexpr auto peek_prev() const -> Token {
        if (current_token == 0) return tokens[0];
        return tokens[current_token - 1];
    }

    [[nodiscard]] constexpr auto check(TokenType tt) const -> bool {
        return peek().type == tt;
    }

    [[nodiscard]] constexpr auto check(std::string_view kw) const -> bool {
        return peek().is_kw(source, kw);
    }

    [[nodiscard]] constexpr auto check_oneof(auto... tt) const -> bool {
        return (check(tt) || ...);
    }

    [[nodiscard]] constexpr auto check_next(TokenType tt) const -> bool {
        if (is_at_end()) return false;
        return tokens[current_token + 1].type == tt;
    }

    [[nodiscard]] constexpr auto check_next(std::string_view kw) const
        -> bool {
        if (is_at_end()) return false;
        return tokens[current_token + 1].is_kw(source, kw);
    }

    [[nodiscard]] constexpr auto match(TokenType tt) -> bool {
        if (!check(tt)) return false;

        advance();
        return true;
    }

    [[nodiscard]] constexpr auto match(std::string_view kw) -> bool {
        if (!check(kw)) return false;

        advance();
        return true;
    }

    [[nodiscard]] constexpr auto span() const -> Span { return peek().span; }
    [[nodiscard]] constexpr auto prev_span() const -> Span {
        return peek_prev().span;
    }

    [[nodiscard]] constexpr auto is_at_end() const -> bool {
        return peek().is_eof();
    }

    constexpr void advance() {
        if (!is_at_end()) current_token++;
    }
};

auto parse_into_ast(std::span<Token const> tokens, std::string_view source,
                    FileId fileid, ast::Ast& ast) -> ast::NodeId {
    ASSERT(!tokens.empty());
    ASSERT(tokens.back().is_eof());

    auto p = Parser{tokens, source, fileid, ast};
    return p.parse_module();
}

auto parse_source(std::string_view source, FileId fileid, ast::Ast& ast)
    -> ast::NodeId {
    auto tokens = tokenize(source, fileid);
    return parse_into_ast(tokens, source, fileid, ast);
}

}  // namespace fuse
