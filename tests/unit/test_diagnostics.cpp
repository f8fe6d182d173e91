// File: tests/unit/test_diagnostics.cpp
// Purpose: Check diagnostic formatting and engine bookkeeping.
// Key invariants: Locations print as path:line:column; a caret line follows
//                 when the source text is known; discard() recounts errors.
// Ownership/Lifetime: Test owns all objects locally.
// Links: src/support/diag_expected.cpp, src/support/diagnostics.cpp

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace shade::support;

namespace
{

std::string print(const Diag &d, const SourceManager *sm)
{
    std::ostringstream os;
    printDiag(d, os, sm);
    return os.str();
}

} // namespace

TEST(Diagnostics, ErrorWithCodeAndCaret)
{
    SourceManager sm;
    const uint32_t fid = sm.addBuffer("main.shd", "a = 1\nb = a + true\n");
    auto d = makeError(SourceLoc{fid, 2, 7}, "bad operands", "T1000", ErrorKind::Type);
    EXPECT_EQ(print(d, &sm), "main.shd:2:7: error[T1000]: bad operands\n"
                             "  b = a + true\n"
                             "        ^\n");
}

TEST(Diagnostics, TabsArePreservedUnderTheCaret)
{
    SourceManager sm;
    const uint32_t fid = sm.addBuffer("tab.shd", "\tx = ?\n");
    auto d = makeError(SourceLoc{fid, 1, 6}, "unrecognized character '?'");
    EXPECT_EQ(print(d, &sm), "tab.shd:1:6: error: unrecognized character '?'\n"
                             "  \tx = ?\n"
                             "  \t    ^\n");
}

TEST(Diagnostics, ZeroColumnOmitsColumnAndCaret)
{
    SourceManager sm;
    const uint32_t fid = sm.addBuffer("z.shd", "a = 1\n");
    auto d = makeError(SourceLoc{fid, 1, 0}, "whole line");
    EXPECT_EQ(print(d, &sm), "z.shd:1: error: whole line\n  a = 1\n");
}

TEST(Diagnostics, UnknownLocationPrintsBareMessage)
{
    SourceManager sm;
    auto d = makeError({}, "'yasm' not found", "X1000", ErrorKind::Toolchain);
    EXPECT_EQ(print(d, &sm), "error[X1000]: 'yasm' not found\n");
    EXPECT_EQ(print(makeNote("parsed 3 statement(s)"), nullptr), "note: parsed 3 statement(s)\n");
}

TEST(Diagnostics, PathOnlyFileHasNoSourceLine)
{
    SourceManager sm;
    const uint32_t fid = sm.addFile("./dir/../only.shd");
    auto d = makeError(SourceLoc{fid, 4, 2}, "message");
    EXPECT_EQ(print(d, &sm), "only.shd:4:2: error: message\n");
}

TEST(Diagnostics, EngineCountsAndDiscards)
{
    DiagnosticEngine de;
    de.report(makeNote("starting"));
    de.report(makeError(SourceLoc{1, 1, 5}, "expected expression", "P1000", ErrorKind::Parse));
    de.report(makeError(SourceLoc{1, 1, 5}, "unrecognized character", "L1000", ErrorKind::Lexical));
    de.report(Diag{Severity::Warning, "odd", {}, {}, ErrorKind::None});
    EXPECT_EQ(de.errorCount(), 2u);
    EXPECT_EQ(de.warningCount(), 1u);
    EXPECT_EQ(de.firstError()->code, "P1000");

    de.discard(ErrorKind::Parse);
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 1u);
    EXPECT_EQ(de.diagnostics().size(), 3u);
    EXPECT_EQ(de.firstError()->code, "L1000");

    de.discard(ErrorKind::Lexical);
    EXPECT_EQ(de.firstError(), nullptr);
}

TEST(Diagnostics, ExpectedCarriesValueOrError)
{
    Expected<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<int> bad = makeError({}, "boom", "I1000", ErrorKind::Internal);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, "I1000");

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> failed = makeError({}, "nope");
    EXPECT_FALSE(failed.hasValue());
    EXPECT_EQ(failed.error().message, "nope");
}

TEST(Diagnostics, ErrorKindNames)
{
    EXPECT_STREQ(errorKindToString(ErrorKind::Lexical), "lexical error");
    EXPECT_STREQ(errorKindToString(ErrorKind::Toolchain), "toolchain error");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
