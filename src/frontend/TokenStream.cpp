//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/TokenStream.cpp
// Purpose: Implements the one-slot pushback buffer used by the parser.
//
//===----------------------------------------------------------------------===//

#include "frontend/TokenStream.hpp"

#include <stdexcept>

namespace shade::frontend
{

TokenStream::TokenStream(TokenSource &source) : source_(source) {}

Token TokenStream::next()
{
    if (pushBack_)
    {
        Token tok = std::move(*pushBack_);
        pushBack_.reset();
        return tok;
    }

    // The source is not asked again after it ended; a pipe whose producer
    // has finished would otherwise block.
    if (end_)
        return *end_;

    Token tok = source_.next();
    if (tok.kind == TokenKind::EndOfInput)
        end_ = tok;
    return tok;
}

void TokenStream::pushBack(Token tok)
{
    if (pushBack_)
        throw std::logic_error("token stream: pushBack called with a token already buffered");
    pushBack_ = std::move(tok);
}

} // namespace shade::frontend
