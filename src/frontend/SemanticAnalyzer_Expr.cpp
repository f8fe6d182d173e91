//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/SemanticAnalyzer_Expr.cpp
// Purpose: Expression typing.
// Key invariants: An Unknown operand comes from an already reported error and
//                 is propagated without a second diagnostic.
// Ownership/Lifetime: See SemanticAnalyzer.hpp.
// Links: frontend/SemanticAnalyzer.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/SemanticAnalyzer.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <string_view>

namespace shade::frontend
{

namespace
{

bool isNumeric(Type type)
{
    return type == Type::Int || type == Type::Float;
}

bool fitsInt64(std::string_view text)
{
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

bool isFiniteDouble(std::string_view text)
{
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size() && std::isfinite(value);
}

} // namespace

Type SemanticAnalyzer::analyzeExpr(Expr &expr, ScopeId scope)
{
    return std::visit(Overload{[&](Variable &v) { return analyzeVariable(v, scope); },
                               [&](Constant &c) { return analyzeConstant(c); },
                               [&](BinaryOp &b) { return analyzeBinary(b, scope); },
                               [&](UnaryOp &u) { return analyzeUnary(u, scope); }},
                      expr.node);
}

Type SemanticAnalyzer::analyzeConstant(Constant &constant)
{
    constant.type = classifyLiteral(constant.literal);
    switch (constant.type)
    {
        case Type::Unknown:
            error(constant.loc,
                  "malformed literal '" + constant.literal + "'",
                  "T1003",
                  support::ErrorKind::Type);
            break;
        case Type::Int:
            if (!fitsInt64(constant.literal))
            {
                error(constant.loc,
                      "integer literal '" + constant.literal + "' does not fit in 64 bits",
                      "T1003",
                      support::ErrorKind::Type);
                constant.type = Type::Unknown;
            }
            break;
        case Type::Float:
            if (!isFiniteDouble(constant.literal))
            {
                error(constant.loc,
                      "float literal '" + constant.literal + "' is out of range",
                      "T1003",
                      support::ErrorKind::Type);
                constant.type = Type::Unknown;
            }
            break;
        default:
            break;
    }
    return constant.type;
}

Type SemanticAnalyzer::analyzeVariable(Variable &var, ScopeId scope)
{
    if (var.isShadowDeclaration)
    {
        error(var.loc,
              "'shadow " + var.name + "' may only appear as an assignment target",
              "S1002",
              support::ErrorKind::Scope);
        var.type = Type::Unknown;
        return var.type;
    }

    const SymbolEntry *entry = program_->tables.lookup(scope, var.name);
    if (!entry)
    {
        error(var.loc,
              "unresolved identifier '" + var.name + "'",
              "S1000",
              support::ErrorKind::Scope);
        var.type = Type::Unknown;
        return var.type;
    }

    var.type = entry->type;
    var.storage = entry->storage;
    return var.type;
}

Type SemanticAnalyzer::analyzeUnary(UnaryOp &unary, ScopeId scope)
{
    const Type operand = analyzeExpr(*unary.operand, scope);
    unary.resultType = Type::Unknown;
    if (operand == Type::Unknown)
        return unary.resultType;

    if (unary.op == Operator::Negate)
    {
        if (isNumeric(operand))
            unary.resultType = operand;
        else
            error(unary.loc,
                  std::string("operator '-' requires an int or float operand, got ") +
                      typeToString(operand),
                  "T1000",
                  support::ErrorKind::Type);
        return unary.resultType;
    }

    if (operand == Type::Bool)
        unary.resultType = Type::Bool;
    else
        error(unary.loc,
              std::string("operator '!' requires a bool operand, got ") + typeToString(operand),
              "T1000",
              support::ErrorKind::Type);
    return unary.resultType;
}

Type SemanticAnalyzer::analyzeBinary(BinaryOp &binary, ScopeId scope)
{
    const Type left = analyzeExpr(*binary.left, scope);
    const Type right = analyzeExpr(*binary.right, scope);
    binary.resultType = Type::Unknown;
    if (left == Type::Unknown || right == Type::Unknown)
        return binary.resultType;

    bool ok = false;
    Type result = Type::Unknown;
    if (isArithmetic(binary.op))
    {
        ok = left == right && isNumeric(left);
        result = left;
    }
    else if (isComparison(binary.op))
    {
        ok = left == right;
        result = Type::Bool;
    }
    else if (isLogical(binary.op))
    {
        ok = left == Type::Bool && right == Type::Bool;
        result = Type::Bool;
    }

    if (!ok)
    {
        error(binary.loc,
              std::string("operator '") + operatorToString(binary.op) + "' cannot be applied to " +
                  typeToString(left) + " and " + typeToString(right),
              "T1000",
              support::ErrorKind::Type);
        return binary.resultType;
    }
    binary.resultType = result;
    return result;
}

} // namespace shade::frontend
