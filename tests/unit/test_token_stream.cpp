// File: tests/unit/test_token_stream.cpp
// Purpose: Exercise one-token pushback and the threaded token pipe.
// Key invariants: A second pushBack without next() is a usage error; the
//                 stream keeps yielding EndOfInput once the source ended; the
//                 pipe delivers exactly the lexer's tokens in order.
// Ownership/Lifetime: Streams borrow sources owned by each test.
// Links: src/frontend/TokenStream.cpp, src/frontend/TokenPipe.cpp

#include <gtest/gtest.h>

#include "frontend/Lexer.hpp"
#include "frontend/TokenPipe.hpp"
#include "frontend/TokenStream.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace shade::frontend;

namespace
{

/// Token source that counts how often it is asked.
class CountingSource final : public TokenSource
{
  public:
    explicit CountingSource(std::vector<std::string> words) : words_(std::move(words)) {}

    Token next() override
    {
        ++calls;
        Token tok;
        if (index_ < words_.size())
        {
            tok.kind = TokenKind::Identifier;
            tok.text = words_[index_++];
        }
        return tok;
    }

    int calls = 0;

  private:
    std::vector<std::string> words_;
    size_t index_ = 0;
};

std::vector<std::string> drain(TokenSource &source)
{
    std::vector<std::string> out;
    for (Token t = source.next(); t.kind != TokenKind::EndOfInput; t = source.next())
        out.push_back(t.text);
    return out;
}

} // namespace

TEST(TokenStream, PushBackIsReturnedFirst)
{
    CountingSource source({"a", "b"});
    TokenStream stream(source);

    Token a = stream.next();
    EXPECT_EQ(a.text, "a");
    stream.pushBack(a);
    EXPECT_TRUE(stream.hasPushBack());
    EXPECT_EQ(stream.next().text, "a");
    EXPECT_FALSE(stream.hasPushBack());
    EXPECT_EQ(stream.next().text, "b");
    EXPECT_EQ(source.calls, 2);
}

TEST(TokenStream, SecondPushBackThrows)
{
    CountingSource source({"a", "b"});
    TokenStream stream(source);
    Token a = stream.next();
    Token b = stream.next();
    stream.pushBack(b);
    EXPECT_THROW(stream.pushBack(a), std::logic_error);
    EXPECT_EQ(stream.next().text, "b");
}

TEST(TokenStream, EndRepeatsWithoutAskingTheSource)
{
    CountingSource source({"only"});
    TokenStream stream(source);
    EXPECT_EQ(stream.next().text, "only");
    EXPECT_EQ(stream.next().kind, TokenKind::EndOfInput);
    EXPECT_EQ(stream.next().kind, TokenKind::EndOfInput);
    EXPECT_EQ(stream.next().kind, TokenKind::EndOfInput);
    EXPECT_EQ(source.calls, 2);
}

TEST(TokenStream, EndOfInputCanBePushedBack)
{
    CountingSource source({});
    TokenStream stream(source);
    Token end = stream.next();
    ASSERT_EQ(end.kind, TokenKind::EndOfInput);
    stream.pushBack(end);
    EXPECT_EQ(stream.next().kind, TokenKind::EndOfInput);
}

TEST(TokenPipe, DeliversLexerTokensInOrder)
{
    const std::string src = "for i = 0; i < 10; i = i + 1 { s = \"x\" }\nb = -8.5 != 3.";
    Lexer lexer(src, 1);
    TokenPipe pipe(src, 1);
    EXPECT_EQ(drain(pipe), drain(lexer));
    EXPECT_FALSE(pipe.lexicalError().has_value());
}

TEST(TokenPipe, PreservesPositions)
{
    TokenPipe pipe("a\n  b", 3);
    Token a = pipe.next();
    Token b = pipe.next();
    EXPECT_EQ(a.loc.line, 1u);
    EXPECT_EQ(b.loc.line, 2u);
    EXPECT_EQ(b.loc.column, 3u);
    EXPECT_EQ(b.loc.file_id, 3u);
    EXPECT_EQ(pipe.next().kind, TokenKind::EndOfInput);
    EXPECT_EQ(pipe.next().kind, TokenKind::EndOfInput);
}

TEST(TokenPipe, ReportsLexicalErrorAfterDraining)
{
    TokenPipe pipe("a = 1 $ b = 2", 1);
    EXPECT_EQ(pipe.next().text, "a");
    // The consumer stops early; lexicalError() drains the rest itself.
    auto err = pipe.lexicalError();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, "L1000");
    EXPECT_EQ(err->loc.column, 7u);
}

TEST(TokenPipe, DestroyingAnUndrainedPipeDoesNotHang)
{
    std::string big;
    for (int i = 0; i < 2000; ++i)
        big += "x = x + 1\n";
    {
        TokenPipe pipe(big, 1);
        EXPECT_EQ(pipe.next().text, "x");
    }
    SUCCEED();
}

TEST(TokenPipe, WorksBehindATokenStream)
{
    TokenPipe pipe("a b", 1);
    TokenStream stream(pipe);
    Token a = stream.next();
    stream.pushBack(a);
    EXPECT_EQ(stream.next().text, "a");
    EXPECT_EQ(stream.next().text, "b");
    EXPECT_EQ(stream.next().kind, TokenKind::EndOfInput);
    EXPECT_EQ(stream.next().kind, TokenKind::EndOfInput);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
