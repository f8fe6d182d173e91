//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/SemanticAnalyzer.hpp
// Purpose: Type resolution and scope checking for parsed Shade programs.
// Key invariants: On success every expression and target carries a concrete
//                 type and every variable a storage symbol.
// Ownership/Lifetime: Analyzer borrows the DiagnosticEngine and mutates the
//                     Program in place.
// Links: frontend/AST.hpp, frontend/SymbolTable.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <string>

namespace shade::frontend
{

/// @brief Walks a Program, fills in types and storage, and checks the rules.
///
/// Scoping rules:
/// - A target without `shadow` that resolves anywhere up the scope chain is a
///   reassignment and must keep the binding's type; otherwise it declares a
///   new binding in the current block.
/// - `shadow x` declares a new binding in the current block that masks any
///   outer `x`; the outer binding is never written.  Redeclaring a name
///   already in the current block is an error.
/// - Reading a name that resolves nowhere is an error.
///
/// Normal errors are reported and analysis moves on to sibling statements.
/// A critical error (a tree that violates the parser's own invariants) stops
/// the walk immediately.
class SemanticAnalyzer
{
  public:
    explicit SemanticAnalyzer(support::DiagnosticEngine &diag);

    /// @brief Analyze @p program in place.
    /// @return Success, or the first error; all errors are also in the engine.
    support::Expected<void> analyze(Program &program);

    /// @brief Number of errors found by the last analyze() call.
    [[nodiscard]] size_t errorCount() const
    {
        return errors_;
    }

  private:
    // Statements (SemanticAnalyzer.cpp)
    void analyzeBlock(Block &block);
    void analyzeStmt(Stmt &stmt, ScopeId scope);
    void analyzeAssignment(Assignment &assign, ScopeId scope);
    void analyzeCondition(Condition &cond, ScopeId scope);
    void analyzeLoop(Loop &loop, ScopeId scope);
    void requireBool(const Expr &expr, Type type, const char *what);
    void bindTarget(Variable &target, Type valueType, ScopeId scope);
    std::string allocateStorage(const std::string &name);

    // Expressions (SemanticAnalyzer_Expr.cpp)
    Type analyzeExpr(Expr &expr, ScopeId scope);
    Type analyzeConstant(Constant &constant);
    Type analyzeVariable(Variable &var, ScopeId scope);
    Type analyzeUnary(UnaryOp &unary, ScopeId scope);
    Type analyzeBinary(BinaryOp &binary, ScopeId scope);

    // Reporting
    void error(support::SourceLoc loc,
               std::string message,
               const char *code,
               support::ErrorKind kind);
    void critical(support::SourceLoc loc, std::string message);

    support::DiagnosticEngine &diag_;
    Program *program_ = nullptr;
    std::optional<support::Diag> first_;
    size_t errors_ = 0;
    bool aborted_ = false;
    unsigned storageCounter_ = 0;
};

} // namespace shade::frontend
