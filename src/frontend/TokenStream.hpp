//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/TokenStream.hpp
// Purpose: Pull interface over a token source with exactly one token of pushback.
// Key invariants: At most one token is buffered; EndOfInput repeats once reached.
// Ownership/Lifetime: Borrows the TokenSource, which must outlive the stream.
// Links: frontend/Parser.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/Token.hpp"

#include <optional>

namespace shade::frontend
{

class TokenStream
{
  public:
    explicit TokenStream(TokenSource &source);

    /// @brief Return the pushed-back token if any, otherwise pull from the source.
    Token next();

    /// @brief Buffer @p tok to be returned by the next call to next().
    /// @throws std::logic_error when a token is already buffered.
    void pushBack(Token tok);

    /// @brief Whether a pushed-back token is waiting.
    [[nodiscard]] bool hasPushBack() const
    {
        return pushBack_.has_value();
    }

  private:
    TokenSource &source_;
    std::optional<Token> pushBack_;
    std::optional<Token> end_;
};

} // namespace shade::frontend
