//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Lexer.cpp
// Purpose: Implements the Shade lexer.
// Key invariants: Two-character operators are matched before their one-character
//                 prefixes; line/column advance on every consumed character.
// Ownership/Lifetime: Lexer owns copy of source.
// Links: frontend/Lexer.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/Lexer.hpp"
#include "frontend/CharUtils.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <cstdio>
#include <string_view>

namespace shade::frontend
{

//===----------------------------------------------------------------------===//
// Token helpers
//===----------------------------------------------------------------------===//

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::EndOfInput:
            return "end of input";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::Keyword:
            return "keyword";
        case TokenKind::Constant:
            return "constant";
        case TokenKind::Operator:
            return "operator";
        case TokenKind::Separator:
            return "','";
        case TokenKind::Assignment:
            return "'='";
        case TokenKind::Semicolon:
            return "';'";
        case TokenKind::ParenOpen:
            return "'('";
        case TokenKind::ParenClose:
            return "')'";
        case TokenKind::CurlyOpen:
            return "'{'";
        case TokenKind::CurlyClose:
            return "'}'";
    }
    return "unknown";
}

std::string describeToken(const Token &tok)
{
    switch (tok.kind)
    {
        case TokenKind::Identifier:
        case TokenKind::Keyword:
        case TokenKind::Constant:
        case TokenKind::Operator:
            return std::string(tokenKindToString(tok.kind)) + " '" + tok.text + "'";
        default:
            return tokenKindToString(tok.kind);
    }
}

namespace
{

constexpr std::array<std::string_view, 4> kKeywords = {"if", "else", "for", "shadow"};

constexpr std::array<std::string_view, 6> kTwoCharOperators = {
    "==", "!=", "<=", ">=", "&&", "||"};

bool isKeyword(std::string_view word)
{
    for (auto kw : kKeywords)
    {
        if (kw == word)
            return true;
    }
    return false;
}

bool isBoolLiteral(std::string_view word)
{
    return word == "true" || word == "false";
}

/// @brief Render @p c for an error message, escaping control bytes.
std::string printableChar(char c)
{
    if (char_utils::isPrintable(c))
        return std::string(1, c);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned char>(c));
    return buf;
}

using char_utils::isDigit;
using char_utils::isIdentifierContinue;
using char_utils::isIdentifierStart;
using char_utils::isWhitespace;

} // namespace

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId) : source_(std::move(source)), fileId_(fileId)
{
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
    {
        return '\0';
    }
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
    {
        return '\0';
    }
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

support::SourceLoc Lexer::currentLoc() const
{
    return support::SourceLoc{fileId_, line_, column_};
}

void Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        const char c = peekChar();
        if (isWhitespace(c))
        {
            getChar();
            continue;
        }
        if (c == '/' && peekChar(1) == '/')
        {
            while (!eof() && peekChar() != '\n')
                getChar();
            continue;
        }
        break;
    }
}

/// @brief Whether the previous token can end an operand.
/// @details Decides if a '-' directly followed by a digit starts a negative
///          literal ("(-8") or is a binary minus ("i-1", "5 -8").
bool Lexer::previousEndsOperand() const
{
    if (!lastKind_)
        return false;
    switch (*lastKind_)
    {
        case TokenKind::Identifier:
        case TokenKind::Constant:
        case TokenKind::ParenClose:
            return true;
        default:
            return false;
    }
}

Token Lexer::makeEnd()
{
    finished_ = true;
    Token tok;
    tok.kind = TokenKind::EndOfInput;
    tok.loc = currentLoc();
    return tok;
}

Token Lexer::fail(support::SourceLoc loc, std::string message, const char *code)
{
    error_ = support::makeError(loc, std::move(message), code, support::ErrorKind::Lexical);
    return makeEnd();
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();
    while (!eof() && isIdentifierContinue(peekChar()))
        tok.text.push_back(getChar());

    if (isKeyword(tok.text))
        tok.kind = TokenKind::Keyword;
    else if (isBoolLiteral(tok.text))
        tok.kind = TokenKind::Constant;
    else
        tok.kind = TokenKind::Identifier;
    return tok;
}

/// @brief Lex `-?digits ['.' digits*]`.
Token Lexer::lexNumber()
{
    Token tok;
    tok.kind = TokenKind::Constant;
    tok.loc = currentLoc();

    if (peekChar() == '-')
        tok.text.push_back(getChar());
    while (isDigit(peekChar()))
        tok.text.push_back(getChar());
    if (peekChar() == '.')
    {
        tok.text.push_back(getChar());
        while (isDigit(peekChar()))
            tok.text.push_back(getChar());
    }
    return tok;
}

Token Lexer::lexString()
{
    Token tok;
    tok.kind = TokenKind::Constant;
    tok.loc = currentLoc();
    tok.text.push_back(getChar()); // opening quote

    while (!eof())
    {
        const char c = peekChar();
        if (c == '\n' || c == '\r')
            break;
        tok.text.push_back(getChar());
        if (c == '"')
            return tok;
    }
    return fail(tok.loc, "unterminated string literal", "L1001");
}

Token Lexer::lexPunctuation()
{
    Token tok;
    tok.loc = currentLoc();

    const char c = peekChar();
    const char pair[2] = {c, peekChar(1)};
    const std::string_view two(pair, 2);
    for (auto op : kTwoCharOperators)
    {
        if (op == two)
        {
            tok.kind = TokenKind::Operator;
            tok.text.assign(op);
            getChar();
            getChar();
            return tok;
        }
    }

    switch (c)
    {
        case '+':
        case '-':
        case '*':
        case '/':
        case '<':
        case '>':
        case '!':
            tok.kind = TokenKind::Operator;
            break;
        case '=':
            tok.kind = TokenKind::Assignment;
            break;
        case ',':
            tok.kind = TokenKind::Separator;
            break;
        case ';':
            tok.kind = TokenKind::Semicolon;
            break;
        case '(':
            tok.kind = TokenKind::ParenOpen;
            break;
        case ')':
            tok.kind = TokenKind::ParenClose;
            break;
        case '{':
            tok.kind = TokenKind::CurlyOpen;
            break;
        case '}':
            tok.kind = TokenKind::CurlyClose;
            break;
        default:
            return fail(tok.loc,
                        "unrecognized character '" + printableChar(c) + "' at line " +
                            std::to_string(tok.loc.line) + ", column " +
                            std::to_string(tok.loc.column),
                        "L1000");
    }
    tok.text.push_back(getChar());
    return tok;
}

Token Lexer::next()
{
    if (finished_)
    {
        Token tok;
        tok.kind = TokenKind::EndOfInput;
        tok.loc = currentLoc();
        return tok;
    }

    skipWhitespaceAndComments();

    if (eof())
        return makeEnd();

    const char c = peekChar();
    Token tok;
    if (isIdentifierStart(c))
        tok = lexIdentifierOrKeyword();
    else if (isDigit(c) || (c == '-' && isDigit(peekChar(1)) && !previousEndsOperand()))
        tok = lexNumber();
    else if (c == '"')
        tok = lexString();
    else
        tok = lexPunctuation();

    lastKind_ = tok.kind;
    return tok;
}

} // namespace shade::frontend
