//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Token.hpp
// Purpose: Declares the token record and the abstract token source shared by
//          the synchronous lexer and the threaded token pipe.
// Key invariants: Tokens are immutable once produced; EndOfInput is sticky.
// Ownership/Lifetime: Tokens own their text.
// Links: frontend/Lexer.hpp, frontend/TokenPipe.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <string>
#include <string_view>

namespace shade::frontend
{

/// @brief Token categories produced by the lexer.
enum class TokenKind
{
    EndOfInput, ///< Designated end-of-stream marker
    Identifier, ///< Letter followed by letters, digits or '_'
    Keyword,    ///< if, else, for, shadow
    Constant,   ///< Number, quoted string, true or false
    Operator,   ///< + - * / == != <= >= < > && || !
    Separator,  ///< ,
    Assignment, ///< =
    Semicolon,  ///< ;
    ParenOpen,
    ParenClose,
    CurlyOpen,
    CurlyClose
};

/// @brief Convert a token kind to a readable string.
const char *tokenKindToString(TokenKind kind);

/// @brief A lexical token with its source position.
struct Token
{
    TokenKind kind = TokenKind::EndOfInput;
    std::string text;         ///< Exact spelling; string constants keep their quotes
    support::SourceLoc loc{}; ///< Position of the first character

    /// @brief True when the token has @p k and spelling @p t.
    [[nodiscard]] bool is(TokenKind k, std::string_view t) const
    {
        return kind == k && text == t;
    }
};

/// @brief Describe @p tok for "expected X, got Y" messages.
/// @return e.g. "identifier 'x'" or "end of input".
std::string describeToken(const Token &tok);

/// @brief Anything the token stream can pull tokens from.
class TokenSource
{
  public:
    virtual ~TokenSource() = default;

    /// @brief Produce the next token; EndOfInput repeats once reached.
    virtual Token next() = 0;
};

} // namespace shade::frontend
