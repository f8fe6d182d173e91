//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Parser_Expr.cpp
// Purpose: Expression productions.
//
// There are no precedence levels.  After a simple expression, any binary
// operator makes the whole remaining expression its right operand, so
// `a OP1 b OP2 c` is always `a OP1 (b OP2 c)`.  A prefix operator likewise
// applies to the entire remaining expression: `-a + b` is `-(a + b)`.
//
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

#include <string>

namespace shade::frontend
{

std::vector<Expr> Parser::parseExpressionList()
{
    std::vector<Expr> list;
    auto first = parseExpression();
    if (!first)
        return list;
    list.push_back(std::move(*first));

    while (accept(TokenKind::Separator))
    {
        auto expr = parseExpression();
        if (!expr)
        {
            if (!hasError_)
                error(next(), "expression after ','");
            return list;
        }
        list.push_back(std::move(*expr));
    }
    return list;
}

std::optional<Expr> Parser::parseExpression()
{
    Token tok = next();
    if (++exprDepth_ > kMaxExprDepth)
    {
        --exprDepth_;
        errorAt(tok.loc,
                "expression nesting too deep (limit: " + std::to_string(kMaxExprDepth) + ")",
                "P1003");
        return std::nullopt;
    }
    struct DepthGuard
    {
        unsigned &d;
        ~DepthGuard() { --d; }
    } guard{exprDepth_};

    if (tok.kind == TokenKind::Operator)
    {
        if (auto op = unaryOperatorFromText(tok.text))
        {
            auto operand = parseExpression();
            if (!operand)
            {
                if (!hasError_)
                    error(next(), "expression after '" + tok.text + "'");
                return std::nullopt;
            }
            return makeUnary(*op, std::move(*operand), tok.loc);
        }
    }
    pushBack(std::move(tok));

    auto left = parseSimpleExpression();
    if (!left)
        return std::nullopt;

    Token opTok = next();
    if (opTok.kind == TokenKind::Operator)
    {
        if (auto op = binaryOperatorFromText(opTok.text))
        {
            auto right = parseExpression();
            if (!right)
            {
                if (!hasError_)
                    error(next(), "expression after '" + opTok.text + "'");
                return std::nullopt;
            }
            return makeBinary(*op, std::move(*left), std::move(*right), opTok.loc);
        }
    }
    pushBack(std::move(opTok));
    return left;
}

std::optional<Expr> Parser::parseSimpleExpression()
{
    Token tok = next();
    switch (tok.kind)
    {
        case TokenKind::Constant:
        {
            const Type type = classifyLiteral(tok.text);
            return makeConstant(type, std::move(tok.text), tok.loc);
        }
        case TokenKind::Identifier:
            return makeVariable(std::move(tok.text), false, tok.loc);
        case TokenKind::Keyword:
            if (tok.text == "shadow")
            {
                pushBack(std::move(tok));
                auto var = parseVar();
                if (!var)
                    return std::nullopt;
                return Expr{std::move(*var)};
            }
            break;
        case TokenKind::ParenOpen:
        {
            auto inner = parseExpression();
            if (!inner)
            {
                if (!hasError_)
                    error(next(), "expression after '('");
                return std::nullopt;
            }
            if (!expect(TokenKind::ParenClose, {}, "')' to close parenthesized expression"))
                return std::nullopt;
            return inner;
        }
        default:
            break;
    }
    pushBack(std::move(tok));
    return std::nullopt;
}

} // namespace shade::frontend
