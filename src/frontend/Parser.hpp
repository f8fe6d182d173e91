//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Parser.hpp
// Purpose: Recursive-descent parser for Shade.
// Key invariants: Binary operators nest right-to-left with no precedence; a
//                 production that fails on its first token pushes it back and
//                 reports nothing; once committed every failure is critical.
// Ownership/Lifetime: Parser borrows the TokenStream and DiagnosticEngine;
//                     the returned Program is owned by the caller.
// Links: frontend/AST.hpp, frontend/TokenStream.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "frontend/TokenStream.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shade::frontend
{

/// @brief Parses one compilation unit.
///
/// Grammar (one function per production):
/// @code
///   program     ::= {statement} EndOfInput
///   statement   ::= condition | loop | block | assignment
///   block       ::= '{' {statement} '}'
///   condition   ::= 'if' expression '{' {statement} '}' ['else' '{' {statement} '}']
///   loop        ::= 'for' [assignment] ';' expressionList ';' [assignment] '{' {statement} '}'
///   assignment  ::= varList '=' expressionList
///   varList     ::= var {',' var}
///   var         ::= ['shadow'] identifier
///   expression  ::= unaryExpr | simpleExpr [binaryOperator expression]
///   unaryExpr   ::= ('-' | '!') expression
///   simpleExpr  ::= var | constant | '(' expression ')'
/// @endcode
///
/// Productions return std::nullopt both for "did not match" and for errors;
/// hasError() tells them apart.
///
/// Every binary or unary operator and every parenthesis adds one level of
/// expression nesting, so long operator chains nest as deeply as nested
/// parentheses.  Nesting beyond kMaxExprDepth or kMaxBlockDepth is a P1003
/// error.
class Parser
{
  public:
    Parser(TokenStream &tokens, support::DiagnosticEngine &diag);

    /// @brief Parse the whole token stream.
    /// @return The program with one symbol table per block, or the first parse error.
    support::Expected<Program> parseProgram();

    [[nodiscard]] bool hasError() const
    {
        return hasError_;
    }

    /// @brief Deepest accepted chain of nested expressions.
    static constexpr unsigned kMaxExprDepth = 1000;
    /// @brief Deepest accepted nesting of blocks.
    static constexpr unsigned kMaxBlockDepth = 256;

  private:
    // Token utilities (Parser.cpp)
    Token next();
    void pushBack(Token tok);
    bool accept(TokenKind kind, std::string_view text = {});
    std::optional<Token> expect(TokenKind kind, std::string_view text, const char *what);
    void error(const Token &found, const std::string &expected);
    void errorAt(support::SourceLoc loc, const std::string &message, const char *code);

    // Statements (Parser_Stmt.cpp)
    bool parseStatementList(Block &block);
    std::optional<Stmt> parseStatement(ScopeId scope);
    std::optional<Block> parseBlockBody(ScopeId parent, support::SourceLoc loc, const char *owner);
    std::optional<Condition> parseCondition(const Token &ifTok, ScopeId scope);
    std::optional<Loop> parseLoop(const Token &forTok, ScopeId scope);
    std::optional<Assignment> parseAssignment();
    std::optional<Variable> parseVar();

    // Expressions (Parser_Expr.cpp)
    std::optional<Expr> parseExpression();
    std::optional<Expr> parseSimpleExpression();
    std::vector<Expr> parseExpressionList();

    TokenStream &tokens_;
    support::DiagnosticEngine &diag_;
    SymbolTableArena *tables_ = nullptr;
    bool hasError_ = false;
    unsigned exprDepth_ = 0;
    unsigned blockDepth_ = 0;
    std::optional<support::Diag> firstError_;
};

} // namespace shade::frontend
