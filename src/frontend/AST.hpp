//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/AST.hpp
// Purpose: Abstract syntax tree for Shade programs.
// Key invariants: Expressions and statements are closed variants; every node
//                 owns its children exclusively; blocks refer to symbol tables
//                 by arena index only.
// Ownership/Lifetime: Program owns the root block and the symbol table arena.
// Links: frontend/Parser.hpp, frontend/SemanticAnalyzer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/SymbolTable.hpp"
#include "frontend/Type.hpp"
#include "support/source_location.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shade::frontend
{

/// @brief Visitor built from a set of lambdas.
template <class... Ts> struct Overload : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> Overload(Ts...) -> Overload<Ts...>;

struct Expr;
struct Stmt;

using ExprPtr = std::unique_ptr<Expr>;

//===----------------------------------------------------------------------===//
// Expression Nodes
//===----------------------------------------------------------------------===//

/// @brief A variable reference or assignment target.
struct Variable
{
    Type type = Type::Unknown;
    std::string name;
    bool isShadowDeclaration = false;
    support::SourceLoc loc{};
    std::string storage; ///< Filled by semantic analysis
};

/// @brief A literal; the type comes from the literal's shape.
struct Constant
{
    Type type = Type::Unknown;
    std::string literal; ///< Source spelling, quotes included for strings
    support::SourceLoc loc{};
};

struct BinaryOp
{
    Operator op = Operator::Plus;
    ExprPtr left;
    ExprPtr right;
    Type resultType = Type::Unknown;
    support::SourceLoc loc{};
};

struct UnaryOp
{
    Operator op = Operator::Negate;
    ExprPtr operand;
    Type resultType = Type::Unknown;
    support::SourceLoc loc{};
};

struct Expr
{
    std::variant<Variable, Constant, BinaryOp, UnaryOp> node;
};

/// @brief Classify a literal spelling: float, then int, then string, then bool.
/// @return Type::Unknown when no shape matches.
Type classifyLiteral(std::string_view literal);

/// @brief Static type of @p expr (resultType for operators).
Type exprType(const Expr &expr);

/// @brief Location of @p expr.
support::SourceLoc exprLoc(const Expr &expr);

Expr makeVariable(std::string name, bool shadow = false, support::SourceLoc loc = {});
Expr makeConstant(Type type, std::string literal, support::SourceLoc loc = {});
Expr makeBinary(Operator op, Expr left, Expr right, support::SourceLoc loc = {});
Expr makeUnary(Operator op, Expr operand, support::SourceLoc loc = {});

//===----------------------------------------------------------------------===//
// Statement Nodes
//===----------------------------------------------------------------------===//

/// @brief `targets = values`; empty in loop headers when omitted.
struct Assignment
{
    std::vector<Variable> targets;
    std::vector<Expr> values;
    support::SourceLoc loc{};

    [[nodiscard]] bool empty() const
    {
        return targets.empty() && values.empty();
    }
};

/// @brief A brace-delimited statement list with its own symbol table.
struct Block
{
    std::vector<Stmt> statements;
    ScopeId scope = kNoScope;
    ScopeId parentScope = kNoScope;
    support::SourceLoc loc{};
};

struct Condition
{
    Expr test;
    Block thenBlock;
    Block elseBlock; ///< Empty when no else branch was written
    support::SourceLoc loc{};
};

struct Loop
{
    Assignment init;
    std::vector<Expr> tests; ///< Conjunction; empty means always true
    Assignment step;
    Block body;
    support::SourceLoc loc{};
};

struct Stmt
{
    std::variant<Assignment, Condition, Loop, Block> node;
};

/// @brief A whole compilation unit.
struct Program
{
    Block root;
    SymbolTableArena tables;
    ScopeId globalScope = 0;
};

//===----------------------------------------------------------------------===//
// Structural comparison
//===----------------------------------------------------------------------===//

/// @brief Compare two trees ignoring locations, scopes and storage symbols.
/// @details Types are compared, so a parsed tree equals another parsed tree,
///          and an analyzed tree equals another analyzed tree.
bool equivalent(const Expr &a, const Expr &b);
bool equivalent(const Assignment &a, const Assignment &b);
bool equivalent(const Block &a, const Block &b);
bool equivalent(const Stmt &a, const Stmt &b);

} // namespace shade::frontend
