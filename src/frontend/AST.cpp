//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/AST.cpp
// Purpose: Literal classification, node accessors, construction helpers and
//          structural comparison.
//
//===----------------------------------------------------------------------===//

#include "frontend/AST.hpp"
#include "frontend/CharUtils.hpp"

namespace shade::frontend
{

namespace
{

/// @brief Length of the `-?digits` prefix of @p s, 0 when there are no digits.
size_t matchSignedDigits(std::string_view s)
{
    size_t i = 0;
    if (i < s.size() && s[i] == '-')
        ++i;
    const size_t firstDigit = i;
    while (i < s.size() && char_utils::isDigit(s[i]))
        ++i;
    return i == firstDigit ? 0 : i;
}

bool isFloatShape(std::string_view s)
{
    size_t i = matchSignedDigits(s);
    if (i == 0 || i >= s.size() || s[i] != '.')
        return false;
    ++i;
    while (i < s.size() && char_utils::isDigit(s[i]))
        ++i;
    return i == s.size();
}

bool isIntShape(std::string_view s)
{
    const size_t n = matchSignedDigits(s);
    return n != 0 && n == s.size();
}

bool isStringShape(std::string_view s)
{
    return s.size() >= 2 && s.front() == '"' && s.back() == '"';
}

} // namespace

Type classifyLiteral(std::string_view literal)
{
    if (isFloatShape(literal))
        return Type::Float;
    if (isIntShape(literal))
        return Type::Int;
    if (isStringShape(literal))
        return Type::String;
    if (literal == "true" || literal == "false")
        return Type::Bool;
    return Type::Unknown;
}

Type exprType(const Expr &expr)
{
    return std::visit(Overload{[](const Variable &v) { return v.type; },
                               [](const Constant &c) { return c.type; },
                               [](const BinaryOp &b) { return b.resultType; },
                               [](const UnaryOp &u) { return u.resultType; }},
                      expr.node);
}

support::SourceLoc exprLoc(const Expr &expr)
{
    return std::visit([](const auto &node) { return node.loc; }, expr.node);
}

Expr makeVariable(std::string name, bool shadow, support::SourceLoc loc)
{
    Variable v;
    v.name = std::move(name);
    v.isShadowDeclaration = shadow;
    v.loc = loc;
    return Expr{std::move(v)};
}

Expr makeConstant(Type type, std::string literal, support::SourceLoc loc)
{
    return Expr{Constant{type, std::move(literal), loc}};
}

Expr makeBinary(Operator op, Expr left, Expr right, support::SourceLoc loc)
{
    BinaryOp b;
    b.op = op;
    b.left = std::make_unique<Expr>(std::move(left));
    b.right = std::make_unique<Expr>(std::move(right));
    b.loc = loc;
    return Expr{std::move(b)};
}

Expr makeUnary(Operator op, Expr operand, support::SourceLoc loc)
{
    UnaryOp u;
    u.op = op;
    u.operand = std::make_unique<Expr>(std::move(operand));
    u.loc = loc;
    return Expr{std::move(u)};
}

namespace
{

bool sameVariable(const Variable &a, const Variable &b)
{
    return a.name == b.name && a.isShadowDeclaration == b.isShadowDeclaration &&
           a.type == b.type;
}

template <class T> bool sameSequence(const std::vector<T> &a, const std::vector<T> &b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (!equivalent(a[i], b[i]))
            return false;
    }
    return true;
}

bool samePointee(const ExprPtr &a, const ExprPtr &b)
{
    if (!a || !b)
        return !a && !b;
    return equivalent(*a, *b);
}

} // namespace

bool equivalent(const Expr &a, const Expr &b)
{
    if (a.node.index() != b.node.index())
        return false;

    return std::visit(
        Overload{[&](const Variable &v) { return sameVariable(v, std::get<Variable>(b.node)); },
                 [&](const Constant &c)
                 {
                     const auto &o = std::get<Constant>(b.node);
                     return c.type == o.type && c.literal == o.literal;
                 },
                 [&](const BinaryOp &bin)
                 {
                     const auto &o = std::get<BinaryOp>(b.node);
                     return bin.op == o.op && bin.resultType == o.resultType &&
                            samePointee(bin.left, o.left) && samePointee(bin.right, o.right);
                 },
                 [&](const UnaryOp &un)
                 {
                     const auto &o = std::get<UnaryOp>(b.node);
                     return un.op == o.op && un.resultType == o.resultType &&
                            samePointee(un.operand, o.operand);
                 }},
        a.node);
}

bool equivalent(const Assignment &a, const Assignment &b)
{
    if (a.targets.size() != b.targets.size())
        return false;
    for (size_t i = 0; i < a.targets.size(); ++i)
    {
        if (!sameVariable(a.targets[i], b.targets[i]))
            return false;
    }
    return sameSequence(a.values, b.values);
}

bool equivalent(const Block &a, const Block &b)
{
    return sameSequence(a.statements, b.statements);
}

bool equivalent(const Stmt &a, const Stmt &b)
{
    if (a.node.index() != b.node.index())
        return false;

    return std::visit(
        Overload{[&](const Assignment &s) { return equivalent(s, std::get<Assignment>(b.node)); },
                 [&](const Condition &s)
                 {
                     const auto &o = std::get<Condition>(b.node);
                     return equivalent(s.test, o.test) && equivalent(s.thenBlock, o.thenBlock) &&
                            equivalent(s.elseBlock, o.elseBlock);
                 },
                 [&](const Loop &s)
                 {
                     const auto &o = std::get<Loop>(b.node);
                     return equivalent(s.init, o.init) && sameSequence(s.tests, o.tests) &&
                            equivalent(s.step, o.step) && equivalent(s.body, o.body);
                 },
                 [&](const Block &s) { return equivalent(s, std::get<Block>(b.node)); }},
        a.node);
}

} // namespace shade::frontend
