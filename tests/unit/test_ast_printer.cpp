// File: tests/unit/test_ast_printer.cpp
// Purpose: Verify that the source printer round-trips through the parser and
//          that the typed dump shows resolved types and storage.
// Key invariants: parse(toSource(parse(s))) is structurally equal to parse(s).
// Ownership/Lifetime: Programs are owned by the compile results in each test.
// Links: src/frontend/AstPrinter.cpp

#include <gtest/gtest.h>

#include "frontend/AST.hpp"
#include "frontend/AstPrinter.hpp"
#include "frontend/Compiler.hpp"
#include "support/source_manager.hpp"

#include <string>

using namespace shade::frontend;
using shade::support::SourceManager;

namespace
{

CompilerResult parseOnly(const std::string &src, SourceManager &sm)
{
    CompilerOptions options{};
    options.pipelined = false;
    options.analyze = false;
    return compile(CompilerInput{src}, options, sm);
}

void expectRoundTrip(const std::string &src)
{
    SourceManager sm;
    CompilerResult first = parseOnly(src, sm);
    ASSERT_TRUE(first.program.has_value()) << src;

    const std::string printed = toSource(*first.program);
    CompilerResult second = parseOnly(printed, sm);
    ASSERT_TRUE(second.program.has_value()) << "printed form did not parse:\n" << printed;
    EXPECT_TRUE(equivalent(first.program->root, second.program->root))
        << "source:\n" << src << "\nprinted:\n" << printed;
    // Printing is a fixed point after one pass.
    EXPECT_EQ(toSource(*second.program), printed);
}

} // namespace

TEST(AstPrinter, RoundTripsExpressions)
{
    expectRoundTrip("shadow a = 6 + 7 * variable / -(5 -- (-8 * - 10000.1234))");
    expectRoundTrip("a = a && b || (5 < false <= 8 && (false2 > variable >= 5.0) != true)");
    expectRoundTrip("x = (1 + 2) * ((3 - 4) / 5)");
    expectRoundTrip("x = -y + 1\nz = -(1) - -2\nw = !(a) && !b");
    expectRoundTrip("s = \"hello world\" < \"\"");
}

TEST(AstPrinter, RoundTripsStatements)
{
    expectRoundTrip("if a == b {\n a = 6\n}\na = 1");
    expectRoundTrip("if a { b = 1 } else { shadow b = 2 c = b }");
    expectRoundTrip("for i, j = 0, 1; i < 10, j > 0; i = i+1 { if b == a { for ;; { c = 6 } } }");
    expectRoundTrip("for ; ; { }\nfor x = 1; ; { }\nfor ; ; x = 2 { }");
    expectRoundTrip("{ shadow x = 1 { shadow x = 2.5 } }");
}

TEST(AstPrinter, SourceLayout)
{
    SourceManager sm;
    CompilerResult r = parseOnly("if a {b=1} else {c=2}\nfor i=0;i<3;i=i+1 {x=-(1)}", sm);
    ASSERT_TRUE(r.program.has_value());
    EXPECT_EQ(toSource(*r.program),
              "if a {\n"
              "    b = 1\n"
              "} else {\n"
              "    c = 2\n"
              "}\n"
              "for i = 0; i < 3; i = i + 1 {\n"
              "    x = -(1)\n"
              "}\n");
}

TEST(AstPrinter, EmptyElseIsOmitted)
{
    SourceManager sm;
    CompilerResult r = parseOnly("if t { }", sm);
    ASSERT_TRUE(r.program.has_value());
    EXPECT_EQ(toSource(*r.program), "if t {\n}\n");
}

TEST(AstPrinter, TypedDumpShowsTypesAndStorage)
{
    SourceManager sm;
    CompilerOptions options{};
    options.pipelined = false;
    CompilerResult r = compile(CompilerInput{"shadow a = 6 + 1\nb = -2.5"}, options, sm);
    ASSERT_TRUE(r.succeeded());

    AstPrinter printer;
    EXPECT_EQ(printer.dump(*r.program),
              "Program (scope 1)\n"
              "  Assignment\n"
              "    Target: shadow a : int [var_a_0]\n"
              "    Value: BinaryOp + : int\n"
              "      Constant 6 : int\n"
              "      Constant 1 : int\n"
              "  Assignment\n"
              "    Target: b : float [var_b_1]\n"
              "    Value: Constant -2.5 : float\n");
}

TEST(AstPrinter, DumpOfLoopWithoutHeader)
{
    SourceManager sm;
    CompilerResult r = parseOnly("for ;; { }", sm);
    ASSERT_TRUE(r.program.has_value());
    AstPrinter printer;
    EXPECT_EQ(printer.dump(*r.program),
              "Program (scope 1)\n"
              "  Loop\n"
              "    Init <none>\n"
              "    Step <none>\n"
              "    Body (scope 2)\n");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
