//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/CodeGenerator.hpp
// Purpose: Lower a typed Shade program into an x86-64 assembly document.
// Key invariants: Every expression leaves its value on the machine stack
//                 (strings as pointer then length); statements leave the
//                 stack as they found it.
// Ownership/Lifetime: The generator borrows the Program for the duration of
//                     generate() and returns the document by value.
// Links: codegen/x86_64/AsmDocument.hpp, frontend/AST.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/common/LabelUtil.hpp"
#include "codegen/x86_64/AsmDocument.hpp"
#include "frontend/AST.hpp"
#include "support/diag_expected.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace shade::codegen::x64
{

/// @brief Lowering from typed AST to assembly; each generate() starts afresh.
///
/// Literal pools:
/// - int and bool literals become `k_int_N` / `k_bool_N` constants;
/// - float literals become `k_flt_N dq <value>` data;
/// - string literals become `k_str_N db "...", 0` data plus a
///   `k_str_N_len` constant.
/// Each distinct literal spelling is pooled once.
class CodeGenerator
{
  public:
    /// @brief Lower @p program.
    /// @return The document, or an internal error when the program is not fully typed.
    support::Expected<AsmDocument> generate(const frontend::Program &program);

  private:
    // Storage and literal pools (CodeGenerator.cpp)
    void emitHeader();
    void declareStorage(const frontend::Program &program);
    std::string intConstant(const std::string &literal);
    std::string boolConstant(const std::string &literal);
    std::string floatLiteral(const std::string &literal);
    std::string stringLiteral(const std::string &literal);

    // Statements (CodeGen_Stmt.cpp)
    void emitBlock(const frontend::Block &block);
    void emitStmt(const frontend::Stmt &stmt);
    void emitAssignment(const frontend::Assignment &assign);
    void emitCondition(const frontend::Condition &cond);
    void emitLoop(const frontend::Loop &loop);
    void storeTarget(const frontend::Variable &target);
    void branchIfFalse(const std::string &label);

    // Expressions (CodeGen_Expr.cpp)
    void emitExpr(const frontend::Expr &expr);
    void emitVariable(const frontend::Variable &var);
    void emitConstant(const frontend::Constant &constant);
    void emitBinary(const frontend::BinaryOp &binary);
    void emitUnary(const frontend::UnaryOp &unary);
    void emitIntBinary(frontend::Operator op);
    void emitFloatBinary(frontend::Operator op);
    void emitStringCompare(frontend::Operator op);

    void instr(std::string mnemonic, std::string operands = {});
    void fail(support::SourceLoc loc, std::string message);
    bool failed() const
    {
        return error_.has_value();
    }

    AsmDocument doc_;
    common::LabelAllocator labels_;
    std::optional<support::Diag> error_;
    std::map<std::string, std::string> intPool_;
    std::map<std::string, std::string> boolPool_;
    std::map<std::string, std::string> floatPool_;
    std::map<std::string, std::string> stringPool_;
};

/// @brief Setcc suffix for a comparison; @p isUnsigned picks below/above forms.
const char *conditionSuffix(frontend::Operator op, bool isUnsigned);

} // namespace shade::codegen::x64
