// File: tests/unit/test_parser.cpp
// Purpose: Check the trees built by the recursive-descent parser and its
//          syntax error reporting.
// Key invariants: Binary operators nest to the right with no precedence; a
//                 unary operator covers the whole remaining expression; every
//                 block gets a symbol table chained to its parent.
// Ownership/Lifetime: Expected trees are built locally and compared
//                     structurally with frontend::equivalent.
// Links: src/frontend/Parser.cpp, src/frontend/Parser_Expr.cpp

#include <gtest/gtest.h>

#include "frontend/AST.hpp"
#include "frontend/AstPrinter.hpp"
#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"
#include "frontend/TokenStream.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace shade::frontend;
using shade::support::DiagnosticEngine;

namespace
{

struct ParseRun
{
    DiagnosticEngine diag;
    std::optional<Program> program;
};

ParseRun parse(const std::string &src)
{
    ParseRun run;
    Lexer lexer(src, 1);
    TokenStream stream(lexer);
    Parser parser(stream, run.diag);
    auto result = parser.parseProgram();
    if (result)
        run.program = std::move(result.value());
    return run;
}

Expr var(const std::string &name, bool shadow = false)
{
    return makeVariable(name, shadow);
}

Variable target(const std::string &name, bool shadow = false)
{
    Variable v;
    v.name = name;
    v.isShadowDeclaration = shadow;
    return v;
}

Expr intc(const std::string &text)
{
    return makeConstant(Type::Int, text);
}

Expr fltc(const std::string &text)
{
    return makeConstant(Type::Float, text);
}

Expr boolc(const std::string &text)
{
    return makeConstant(Type::Bool, text);
}

Expr bin(Operator op, Expr l, Expr r)
{
    return makeBinary(op, std::move(l), std::move(r));
}

Expr neg(Expr e)
{
    return makeUnary(Operator::Negate, std::move(e));
}

template <class... Es> std::vector<Expr> exprs(Es... es)
{
    std::vector<Expr> out;
    (out.push_back(std::move(es)), ...);
    return out;
}

Stmt assign(std::vector<Variable> targets, std::vector<Expr> values)
{
    Assignment a;
    a.targets = std::move(targets);
    a.values = std::move(values);
    return Stmt{std::move(a)};
}

template <class... Ss> Block block(Ss... ss)
{
    Block b;
    (b.statements.push_back(std::move(ss)), ...);
    return b;
}

Stmt cond(Expr test, Block thenBlock, Block elseBlock)
{
    Condition c;
    c.test = std::move(test);
    c.thenBlock = std::move(thenBlock);
    c.elseBlock = std::move(elseBlock);
    return Stmt{std::move(c)};
}

Stmt loop(Stmt init, std::vector<Expr> tests, Stmt step, Block body)
{
    Loop l;
    l.init = std::move(std::get<Assignment>(init.node));
    l.tests = std::move(tests);
    l.step = std::move(std::get<Assignment>(step.node));
    l.body = std::move(body);
    return Stmt{std::move(l)};
}

Stmt none()
{
    return Stmt{Assignment{}};
}

void expectTree(const std::string &src, const Block &expected)
{
    ParseRun run = parse(src);
    ASSERT_TRUE(run.program.has_value()) << "parse failed for: " << src;
    EXPECT_EQ(run.diag.errorCount(), 0u);
    EXPECT_TRUE(equivalent(run.program->root, expected))
        << "got:\n" << toSource(run.program->root) << "expected:\n" << toSource(expected);
}

const shade::support::Diagnostic &onlyError(const ParseRun &run)
{
    EXPECT_FALSE(run.program.has_value());
    EXPECT_EQ(run.diag.errorCount(), 1u);
    return run.diag.diagnostics().front();
}

} // namespace

TEST(Parser, ExpressionsNestRightWithoutPrecedence)
{
    expectTree(
        "shadow a = 6 + 7 * variable / -(5 -- (-8 * - 10000.1234))",
        block(assign(
            {target("a", true)},
            exprs(bin(Operator::Plus,
                      intc("6"),
                      bin(Operator::Mult,
                          intc("7"),
                          bin(Operator::Div,
                              var("variable"),
                              neg(bin(Operator::Minus,
                                      intc("5"),
                                      neg(bin(Operator::Mult,
                                              intc("-8"),
                                              neg(fltc("10000.1234")))))))))))));
}

TEST(Parser, NegativeFloatAfterOperatorIsOneConstant)
{
    // With no space after the second '-', the lexer folds it into the literal.
    expectTree(
        "shadow a = 6 + 7 * variable / -(5 -- (-8 * -10000.1234))",
        block(assign(
            {target("a", true)},
            exprs(bin(Operator::Plus,
                      intc("6"),
                      bin(Operator::Mult,
                          intc("7"),
                          bin(Operator::Div,
                              var("variable"),
                              neg(bin(Operator::Minus,
                                      intc("5"),
                                      neg(bin(Operator::Mult,
                                              intc("-8"),
                                              fltc("-10000.1234"))))))))))));
}

TEST(Parser, LogicalAndComparisonChains)
{
    expectTree(
        "a = a && b || (5 < false <= 8 && (false2 > variable >= 5.0) != true)",
        block(assign(
            {target("a")},
            exprs(bin(
                Operator::And,
                var("a"),
                bin(Operator::Or,
                    var("b"),
                    bin(Operator::Less,
                        intc("5"),
                        bin(Operator::Le,
                            boolc("false"),
                            bin(Operator::And,
                                intc("8"),
                                bin(Operator::Ne,
                                    bin(Operator::Greater,
                                        var("false2"),
                                        bin(Operator::Ge, var("variable"), fltc("5.0"))),
                                    boolc("true")))))))))));
}

TEST(Parser, UnaryCoversTheRestOfTheExpression)
{
    expectTree("x = -a + b",
               block(assign({target("x")}, exprs(neg(bin(Operator::Plus, var("a"), var("b")))))));
    expectTree("x = !a && b",
               block(assign({target("x")},
                            exprs(makeUnary(Operator::Not,
                                            bin(Operator::And, var("a"), var("b")))))));
}

TEST(Parser, IfWithoutElseGetsEmptyElseBlock)
{
    expectTree("\n\tif a == b {\n\t\ta = 6\n\t}\n\ta = 1\n",
               block(cond(bin(Operator::Eq, var("a"), var("b")),
                          block(assign({target("a")}, exprs(intc("6")))),
                          block()),
                     assign({target("a")}, exprs(intc("1")))));
}

TEST(Parser, IfElse)
{
    expectTree("if a == b {\n a = 6\n} else {\n a = 1\n}",
               block(cond(bin(Operator::Eq, var("a"), var("b")),
                          block(assign({target("a")}, exprs(intc("6")))),
                          block(assign({target("a")}, exprs(intc("1")))))));
}

TEST(Parser, MultipleAssignment)
{
    expectTree("a = 1\na, b = 1, 2\na, b, c = 1, 2, 3",
               block(assign({target("a")}, exprs(intc("1"))),
                     assign({target("a"), target("b")}, exprs(intc("1"), intc("2"))),
                     assign({target("a"), target("b"), target("c")},
                            exprs(intc("1"), intc("2"), intc("3")))));
}

TEST(Parser, LoopWithEmptyHeader)
{
    expectTree("for ;; {\n a = a+1\n}",
               block(loop(none(),
                          {},
                          none(),
                          block(assign({target("a")},
                                       exprs(bin(Operator::Plus, var("a"), intc("1"))))))));
}

TEST(Parser, LoopWithInitOnly)
{
    expectTree("for i = 5;; {\n a = 0\n}",
               block(loop(assign({target("i")}, exprs(intc("5"))),
                          {},
                          none(),
                          block(assign({target("a")}, exprs(intc("0")))))));
}

TEST(Parser, NestedLoopsAndConditions)
{
    expectTree(
        "for i, j = 0, 1; i < 10; i = i+1 {\n"
        "  if b == a {\n"
        "    for ;; {\n"
        "      c = 6\n"
        "    }\n"
        "  }\n"
        "}\n",
        block(loop(assign({target("i"), target("j")}, exprs(intc("0"), intc("1"))),
                   exprs(bin(Operator::Less, var("i"), intc("10"))),
                   assign({target("i")}, exprs(bin(Operator::Plus, var("i"), intc("1")))),
                   block(cond(bin(Operator::Eq, var("b"), var("a")),
                              block(loop(none(),
                                         {},
                                         none(),
                                         block(assign({target("c")}, exprs(intc("6")))))),
                              block())))));
}

TEST(Parser, LoopConditionListIsAConjunction)
{
    expectTree("for ; a, b < 3; {\n}",
               block(loop(none(), exprs(var("a"), bin(Operator::Less, var("b"), intc("3"))),
                          none(), block())));
}

TEST(Parser, BareBlockAndEmptyProgram)
{
    expectTree("{ shadow x = 1 }", block(Stmt{block(assign({target("x", true)}, exprs(intc("1"))))}));
    expectTree("", block());
    expectTree("// nothing here\n", block());
}

TEST(Parser, EveryBlockHasAChainedScope)
{
    ParseRun run = parse("if a { b = 1 } else { c = 2 }\nfor ;; { { d = 3 } }");
    ASSERT_TRUE(run.program.has_value());
    const Program &p = *run.program;
    EXPECT_EQ(p.globalScope, 0u);
    EXPECT_EQ(p.root.parentScope, p.globalScope);
    EXPECT_EQ(p.tables.at(p.root.scope).parent(), p.globalScope);

    const auto &c = std::get<Condition>(p.root.statements[0].node);
    EXPECT_EQ(c.thenBlock.parentScope, p.root.scope);
    EXPECT_EQ(c.elseBlock.parentScope, p.root.scope);
    EXPECT_NE(c.thenBlock.scope, c.elseBlock.scope);

    const auto &l = std::get<Loop>(p.root.statements[1].node);
    EXPECT_EQ(l.body.parentScope, p.root.scope);
    const auto &inner = std::get<Block>(l.body.statements[0].node);
    EXPECT_EQ(inner.parentScope, l.body.scope);
    EXPECT_EQ(p.tables.at(inner.scope).parent(), l.body.scope);

    // global, root, then, else, loop body, inner block
    EXPECT_EQ(p.tables.size(), 6u);
}

TEST(Parser, ParenthesesAreNotKept)
{
    expectTree("x = ((1))", block(assign({target("x")}, exprs(intc("1")))));
    expectTree("x = (1 + 2) * 3",
               block(assign({target("x")},
                            exprs(bin(Operator::Mult,
                                      bin(Operator::Plus, intc("1"), intc("2")),
                                      intc("3"))))));
}

TEST(Parser, LiteralShapesAreClassified)
{
    expectTree("s, f, i, b = \"str\", 1.5, 42, true",
               block(assign({target("s"), target("f"), target("i"), target("b")},
                            exprs(makeConstant(Type::String, "\"str\""),
                                  fltc("1.5"),
                                  intc("42"),
                                  boolc("true")))));
}

TEST(Parser, CountMismatchIsAParseError)
{
    ParseRun run = parse("a, b = 1");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.code, "P1001");
    EXPECT_EQ(d.kind, shade::support::ErrorKind::Parse);
    EXPECT_EQ(d.message, "assignment has 2 target(s) but 1 value(s)");
}

TEST(Parser, MissingClosingBrace)
{
    ParseRun run = parse("if a {\n b = 1\n");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.code, "P1000");
    EXPECT_EQ(d.message, "expected '}' to close if body, got end of input");
}

TEST(Parser, MissingAssignmentOperator)
{
    ParseRun run = parse("a b = 1");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.code, "P1000");
    EXPECT_EQ(d.message, "expected '=' after assignment targets, got identifier 'b'");
    EXPECT_EQ(d.loc.column, 3u);
}

TEST(Parser, MissingConditionExpression)
{
    ParseRun run = parse("if { }");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.message, "expected condition expression after 'if', got '{'");
}

TEST(Parser, LoopNeedsBothSemicolons)
{
    ParseRun run = parse("for i = 0; i < 3 {\n}");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.message, "expected ';' after loop condition, got '{'");
}

TEST(Parser, DanglingOperator)
{
    ParseRun run = parse("a = 1 +");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.message, "expected expression after '+', got end of input");
}

TEST(Parser, UnclosedParenthesis)
{
    ParseRun run = parse("a = (1 + 2");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.message, "expected ')' to close parenthesized expression, got end of input");
}

TEST(Parser, TrailingInputAtTopLevel)
{
    ParseRun run = parse("a = 1 }");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.code, "P1002");
    EXPECT_EQ(d.message, "expected statement or end of input, got '}'");
}

TEST(Parser, ShadowNeedsAnIdentifier)
{
    ParseRun run = parse("shadow = 1");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.message, "expected identifier after 'shadow', got '='");
}

TEST(Parser, ElseWithoutBlock)
{
    ParseRun run = parse("if a { } else b = 1");
    const auto &d = onlyError(run);
    EXPECT_EQ(d.message, "expected '{' after 'else', got identifier 'b'");
}

TEST(Parser, LongOperatorChainWithinLimitIsAccepted)
{
    std::string src = "x = 1";
    for (unsigned i = 1; i < Parser::kMaxExprDepth; ++i)
        src += " + 1";
    ParseRun run = parse(src);
    ASSERT_TRUE(run.program.has_value());
    EXPECT_EQ(run.diag.errorCount(), 0u);
}

TEST(Parser, OperatorChainBeyondLimitIsRejected)
{
    std::string src = "x = 1";
    for (unsigned i = 0; i < Parser::kMaxExprDepth; ++i)
        src += " + 1";
    ParseRun run = parse(src);
    const auto &d = onlyError(run);
    EXPECT_EQ(d.code, "P1003");
    EXPECT_EQ(d.message, "expression nesting too deep (limit: 1000)");
}

TEST(Parser, VeryLongOperatorChainFailsCleanly)
{
    std::string src = "x = 1";
    for (int i = 0; i < 200000; ++i)
        src += " + 1";
    ParseRun run = parse(src);
    EXPECT_EQ(onlyError(run).code, "P1003");
}

TEST(Parser, DeepParenthesesAndUnaryChainsAreRejected)
{
    const std::string parens = "x = " + std::string(5000, '(') + "1" + std::string(5000, ')');
    EXPECT_EQ(onlyError(parse(parens)).code, "P1003");

    const std::string nots = "x = " + std::string(5000, '!') + "true";
    EXPECT_EQ(onlyError(parse(nots)).code, "P1003");
}

TEST(Parser, DeepBlockNestingIsRejected)
{
    ParseRun within = parse(std::string(Parser::kMaxBlockDepth, '{') +
                            std::string(Parser::kMaxBlockDepth, '}'));
    ASSERT_TRUE(within.program.has_value());

    const std::string deep = std::string(10000, '{') + std::string(10000, '}');
    ParseRun run = parse(deep);
    const auto &d = onlyError(run);
    EXPECT_EQ(d.code, "P1003");
    EXPECT_EQ(d.message, "block nesting too deep (limit: 256)");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
