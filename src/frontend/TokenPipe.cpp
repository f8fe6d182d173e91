//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/TokenPipe.cpp
// Purpose: Producer/consumer hand-off between the lexer thread and the parser.
//
// The producer blocks while the slot is full, so lexing and parsing proceed in
// lockstep with O(1) tokens in flight.  A lexical error never travels in-band:
// the producer stores it, then publishes EndOfInput.  Once the consumer has
// seen EndOfInput the producer has returned and can be joined.
//
//===----------------------------------------------------------------------===//

#include "frontend/TokenPipe.hpp"

namespace shade::frontend
{

TokenPipe::TokenPipe(std::string source, uint32_t fileId)
    : lexer_(std::move(source), fileId), producer_([this] { produce(); })
{
}

TokenPipe::~TokenPipe()
{
    finish();
}

void TokenPipe::produce()
{
    for (;;)
    {
        Token tok = lexer_.next();
        const bool atEnd = tok.kind == TokenKind::EndOfInput;

        std::unique_lock<std::mutex> lock(mutex_);
        if (atEnd && lexer_.error())
            error_ = *lexer_.error();
        slotChanged_.wait(lock, [this] { return !slot_.has_value(); });
        slot_ = std::move(tok);
        lock.unlock();
        slotChanged_.notify_all();

        if (atEnd)
            return;
    }
}

Token TokenPipe::next()
{
    if (end_)
        return *end_;

    std::unique_lock<std::mutex> lock(mutex_);
    slotChanged_.wait(lock, [this] { return slot_.has_value(); });
    Token tok = std::move(*slot_);
    slot_.reset();
    lock.unlock();
    slotChanged_.notify_all();

    if (tok.kind == TokenKind::EndOfInput)
        end_ = tok;
    return tok;
}

void TokenPipe::finish()
{
    while (!end_)
        next();
    if (producer_.joinable())
        producer_.join();
}

std::optional<support::Diagnostic> TokenPipe::lexicalError()
{
    finish();
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

} // namespace shade::frontend
