//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/TokenPipe.hpp
// Purpose: Runs a Lexer on a producer thread and hands tokens to the parser
//          through a single-slot channel.
// Key invariants: At most one token is in flight; the lexical error slot is
//                 written before EndOfInput is published; the consumer drains
//                 to EndOfInput before the producer is joined.
// Ownership/Lifetime: Owns the lexer and the producer thread; the destructor
//                     drains and joins.
// Links: frontend/Lexer.hpp, frontend/TokenStream.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/Lexer.hpp"
#include "support/diagnostics.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace shade::frontend
{

class TokenPipe final : public TokenSource
{
  public:
    /// @brief Start lexing @p source on a producer thread.
    TokenPipe(std::string source, uint32_t fileId);

    TokenPipe(const TokenPipe &) = delete;
    TokenPipe &operator=(const TokenPipe &) = delete;

    /// @brief Drains the channel and joins the producer.
    ~TokenPipe() override;

    /// @brief Block until the producer publishes the next token.
    Token next() override;

    /// @brief Consume remaining tokens up to EndOfInput and join the producer.
    void finish();

    /// @brief Drain the pipe, then return the lexical error if one occurred.
    std::optional<support::Diagnostic> lexicalError();

  private:
    void produce();

    Lexer lexer_;

    std::mutex mutex_;
    std::condition_variable slotChanged_;
    std::optional<Token> slot_;
    std::optional<support::Diagnostic> error_;

    std::optional<Token> end_; ///< Consumer side only
    std::thread producer_;
};

} // namespace shade::frontend
