//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Parser.cpp
// Purpose: Parser entry point and token utilities.
// Key invariants: The root block is followed by EndOfInput.
// Ownership/Lifetime: See Parser.hpp.
// Links: frontend/Parser.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace shade::frontend
{

Parser::Parser(TokenStream &tokens, support::DiagnosticEngine &diag)
    : tokens_(tokens), diag_(diag)
{
}

//=============================================================================
// Token Utilities
//=============================================================================

Token Parser::next()
{
    return tokens_.next();
}

void Parser::pushBack(Token tok)
{
    tokens_.pushBack(std::move(tok));
}

/// @brief Consume the next token if it has @p kind (and @p text when given).
bool Parser::accept(TokenKind kind, std::string_view text)
{
    Token tok = next();
    if (tok.kind == kind && (text.empty() || tok.text == text))
        return true;
    pushBack(std::move(tok));
    return false;
}

std::optional<Token> Parser::expect(TokenKind kind, std::string_view text, const char *what)
{
    Token tok = next();
    if (tok.kind == kind && (text.empty() || tok.text == text))
        return tok;
    error(tok, what);
    return std::nullopt;
}

void Parser::error(const Token &found, const std::string &expected)
{
    errorAt(found.loc, "expected " + expected + ", got " + describeToken(found), "P1000");
}

void Parser::errorAt(support::SourceLoc loc, const std::string &message, const char *code)
{
    // Only the first failure is reported: after it the parser unwinds without
    // consuming more input.
    if (hasError_)
        return;
    hasError_ = true;
    auto d = support::makeError(loc, message, code, support::ErrorKind::Parse);
    firstError_ = d;
    diag_.report(std::move(d));
}

//=============================================================================
// Program
//=============================================================================

support::Expected<Program> Parser::parseProgram()
{
    Program program;
    tables_ = &program.tables;
    program.globalScope = program.tables.create(kNoScope);
    program.root.parentScope = program.globalScope;
    program.root.scope = program.tables.create(program.globalScope);

    Token first = next();
    program.root.loc = first.loc;
    pushBack(std::move(first));

    if (parseStatementList(program.root))
    {
        Token tok = next();
        if (tok.kind != TokenKind::EndOfInput)
            errorAt(tok.loc,
                    "expected statement or end of input, got " + describeToken(tok),
                    "P1002");
    }

    tables_ = nullptr;
    if (hasError_)
        return *firstError_;
    return std::move(program);
}

} // namespace shade::frontend
