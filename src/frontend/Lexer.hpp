//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Lexer.hpp
// Purpose: Declares the lexer turning Shade source text into tokens on demand.
// Key invariants: At most one lexical error; after it only EndOfInput is produced.
// Ownership/Lifetime: Lexer owns a copy of the source buffer.
// Links: frontend/Token.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/Token.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace shade::frontend
{

/// @brief Lazy, non-restartable tokenizer.
/// @details The lexer does not report into a DiagnosticEngine because it may
///          run on the token pipe's producer thread; the single lexical error
///          is stored and read back through error() by the consumer.
class Lexer final : public TokenSource
{
  public:
    /// @brief Create a lexer over @p source.
    /// @param source Source text; copied.
    /// @param fileId File id used in token locations.
    Lexer(std::string source, uint32_t fileId);

    /// @brief Return the next token, or EndOfInput once input or an error ends the stream.
    Token next() override;

    /// @brief The lexical error that ended the stream, if any.
    [[nodiscard]] const std::optional<support::Diagnostic> &error() const
    {
        return error_;
    }

  private:
    char peekChar(size_t offset = 0) const;
    char getChar();
    bool eof() const;
    support::SourceLoc currentLoc() const;

    void skipWhitespaceAndComments();
    bool previousEndsOperand() const;

    Token lexIdentifierOrKeyword();
    Token lexNumber();
    Token lexString();
    Token lexPunctuation();

    Token makeEnd();
    Token fail(support::SourceLoc loc, std::string message, const char *code);

    std::string source_;
    size_t pos_{0};
    uint32_t fileId_;
    uint32_t line_{1};
    uint32_t column_{1};
    std::optional<TokenKind> lastKind_;
    bool finished_{false};
    std::optional<support::Diagnostic> error_;
};

} // namespace shade::frontend
