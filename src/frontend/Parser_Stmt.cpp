//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Parser_Stmt.cpp
// Purpose: Statement productions: blocks, conditions, loops and assignments.
// Key invariants: Every Block receives a fresh symbol table chained to the
//                 enclosing block's table, including an omitted else branch.
// Ownership/Lifetime: See Parser.hpp.
// Links: frontend/Parser.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace shade::frontend
{

/// @brief Parse statements until one fails to match.
/// @return False when a statement failed after committing.
bool Parser::parseStatementList(Block &block)
{
    for (;;)
    {
        auto stmt = parseStatement(block.scope);
        if (!stmt)
            return !hasError_;
        block.statements.push_back(std::move(*stmt));
    }
}

std::optional<Stmt> Parser::parseStatement(ScopeId scope)
{
    Token tok = next();

    if (tok.is(TokenKind::Keyword, "if"))
    {
        auto cond = parseCondition(tok, scope);
        if (!cond)
            return std::nullopt;
        return Stmt{std::move(*cond)};
    }

    if (tok.is(TokenKind::Keyword, "for"))
    {
        auto loop = parseLoop(tok, scope);
        if (!loop)
            return std::nullopt;
        return Stmt{std::move(*loop)};
    }

    if (tok.kind == TokenKind::CurlyOpen)
    {
        auto block = parseBlockBody(scope, tok.loc, "block");
        if (!block)
            return std::nullopt;
        return Stmt{std::move(*block)};
    }

    pushBack(std::move(tok));
    auto assign = parseAssignment();
    if (!assign)
        return std::nullopt;
    return Stmt{std::move(*assign)};
}

/// @brief Parse `{statement} '}'` after an opening brace has been consumed.
std::optional<Block> Parser::parseBlockBody(ScopeId parent,
                                            support::SourceLoc loc,
                                            const char *owner)
{
    if (++blockDepth_ > kMaxBlockDepth)
    {
        --blockDepth_;
        errorAt(loc,
                "block nesting too deep (limit: " + std::to_string(kMaxBlockDepth) + ")",
                "P1003");
        return std::nullopt;
    }
    struct DepthGuard
    {
        unsigned &d;
        ~DepthGuard() { --d; }
    } guard{blockDepth_};

    Block block;
    block.loc = loc;
    block.parentScope = parent;
    block.scope = tables_->create(parent);

    if (!parseStatementList(block))
        return std::nullopt;
    if (!expect(TokenKind::CurlyClose, {}, (std::string("'}' to close ") + owner).c_str()))
        return std::nullopt;
    return block;
}

std::optional<Condition> Parser::parseCondition(const Token &ifTok, ScopeId scope)
{
    Condition cond;
    cond.loc = ifTok.loc;

    auto test = parseExpression();
    if (!test)
    {
        if (!hasError_)
            error(next(), "condition expression after 'if'");
        return std::nullopt;
    }
    cond.test = std::move(*test);

    auto open = expect(TokenKind::CurlyOpen, {}, "'{' after if condition");
    if (!open)
        return std::nullopt;
    auto thenBlock = parseBlockBody(scope, open->loc, "if body");
    if (!thenBlock)
        return std::nullopt;
    cond.thenBlock = std::move(*thenBlock);

    Token tok = next();
    if (tok.is(TokenKind::Keyword, "else"))
    {
        auto elseOpen = expect(TokenKind::CurlyOpen, {}, "'{' after 'else'");
        if (!elseOpen)
            return std::nullopt;
        auto elseBlock = parseBlockBody(scope, elseOpen->loc, "else body");
        if (!elseBlock)
            return std::nullopt;
        cond.elseBlock = std::move(*elseBlock);
        return cond;
    }

    pushBack(std::move(tok));
    cond.elseBlock.loc = cond.loc;
    cond.elseBlock.parentScope = scope;
    cond.elseBlock.scope = tables_->create(scope);
    return cond;
}

std::optional<Loop> Parser::parseLoop(const Token &forTok, ScopeId scope)
{
    Loop loop;
    loop.loc = forTok.loc;

    if (auto init = parseAssignment())
        loop.init = std::move(*init);
    else if (hasError_)
        return std::nullopt;

    if (!expect(TokenKind::Semicolon, {}, "';' after loop initializer"))
        return std::nullopt;

    loop.tests = parseExpressionList();
    if (hasError_)
        return std::nullopt;

    if (!expect(TokenKind::Semicolon, {}, "';' after loop condition"))
        return std::nullopt;

    if (auto step = parseAssignment())
        loop.step = std::move(*step);
    else if (hasError_)
        return std::nullopt;

    auto open = expect(TokenKind::CurlyOpen, {}, "'{' to start loop body");
    if (!open)
        return std::nullopt;
    auto body = parseBlockBody(scope, open->loc, "loop body");
    if (!body)
        return std::nullopt;
    loop.body = std::move(*body);
    return loop;
}

std::optional<Assignment> Parser::parseAssignment()
{
    auto first = parseVar();
    if (!first)
        return std::nullopt;

    Assignment assign;
    assign.loc = first->loc;
    assign.targets.push_back(std::move(*first));

    while (accept(TokenKind::Separator))
    {
        auto var = parseVar();
        if (!var)
        {
            if (!hasError_)
                error(next(), "variable after ','");
            return std::nullopt;
        }
        assign.targets.push_back(std::move(*var));
    }

    auto eq = expect(TokenKind::Assignment, {}, "'=' after assignment targets");
    if (!eq)
        return std::nullopt;

    assign.values = parseExpressionList();
    if (hasError_)
        return std::nullopt;

    if (assign.values.size() != assign.targets.size())
    {
        errorAt(eq->loc,
                "assignment has " + std::to_string(assign.targets.size()) + " target(s) but " +
                    std::to_string(assign.values.size()) + " value(s)",
                "P1001");
        return std::nullopt;
    }
    return assign;
}

std::optional<Variable> Parser::parseVar()
{
    Token tok = next();
    if (tok.is(TokenKind::Keyword, "shadow"))
    {
        Token name = next();
        if (name.kind != TokenKind::Identifier)
        {
            error(name, "identifier after 'shadow'");
            return std::nullopt;
        }
        Variable var;
        var.name = std::move(name.text);
        var.isShadowDeclaration = true;
        var.loc = tok.loc;
        return var;
    }

    if (tok.kind == TokenKind::Identifier)
    {
        Variable var;
        var.name = std::move(tok.text);
        var.loc = tok.loc;
        return var;
    }

    pushBack(std::move(tok));
    return std::nullopt;
}

} // namespace shade::frontend
