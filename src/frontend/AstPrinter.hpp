//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/AstPrinter.hpp
// Purpose: Textual renderings of the AST.
//
// Two forms are produced:
// - Source form: valid Shade text that parses back to a structurally
//   identical tree.  Parentheses are inserted wherever the precedence-free,
//   right-recursive grammar would otherwise regroup operands.
// - Dump form: an indented tree showing node kinds, operators and resolved
//   types, used by `shadec --dump-typed-ast` and by tests.
//
// Example dump:
//   Program (scope 1)
//     Assignment
//       Target: shadow a : int [var_a_0]
//       Value: BinaryOp + : int
//         Constant 6 : int
//         Variable b : int
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"

#include <ostream>
#include <string>

namespace shade::frontend
{

/// @brief Render @p program as re-parsable source text.
std::string toSource(const Program &program);

/// @brief Render one statement list as source text (no enclosing braces).
std::string toSource(const Block &block);

/// @brief Render @p expr as source text.
std::string toSource(const Expr &expr);

/// @brief Emits an indented, typed dump of the AST for debugging.
class AstPrinter
{
  public:
    /// @brief Produce a formatted dump of the given program.
    std::string dump(const Program &program);

    /// @brief Produce a formatted dump of a single expression.
    std::string dump(const Expr &expr);

  private:
    void line(const std::string &text);
    void printBlock(const char *label, const Block &block);
    void printStmt(const Stmt &stmt);
    void printAssignment(const char *label, const Assignment &assign);
    void printExpr(const char *label, const Expr &expr);

    std::string out_;
    int indent_ = 0;
};

} // namespace shade::frontend
