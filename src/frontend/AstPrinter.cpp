//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/AstPrinter.cpp
// Purpose: Source-form and dump-form printers for the Shade AST.
// Key invariants: toSource output re-parses to an equivalent tree.
// Ownership/Lifetime: Printers only read the tree.
// Links: frontend/AstPrinter.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/AstPrinter.hpp"

#include <sstream>

namespace shade::frontend
{

namespace
{

//===----------------------------------------------------------------------===//
// Source form
//===----------------------------------------------------------------------===//

class SourceWriter
{
  public:
    std::string take()
    {
        return os_.str();
    }

    void writeStatements(const Block &block)
    {
        for (const auto &stmt : block.statements)
            writeStmt(stmt);
    }

    void writeExpr(const Expr &expr)
    {
        std::visit(Overload{[&](const Variable &v) { writeVariable(v); },
                            [&](const Constant &c) { os_ << c.literal; },
                            [&](const BinaryOp &b) { writeBinary(b); },
                            [&](const UnaryOp &u) { writeUnary(u); }},
                   expr.node);
    }

  private:
    void indent()
    {
        for (int i = 0; i < depth_; ++i)
            os_ << "    ";
    }

    void writeVariable(const Variable &v)
    {
        if (v.isShadowDeclaration)
            os_ << "shadow ";
        os_ << v.name;
    }

    // A left operand is a simpleExpr; anything with an operator of its own
    // must be parenthesized or the right-recursive grammar would absorb the
    // rest of the chain into it.
    void writeBinary(const BinaryOp &b)
    {
        const bool wrapLeft = std::holds_alternative<BinaryOp>(b.left->node) ||
                              std::holds_alternative<UnaryOp>(b.left->node);
        if (wrapLeft)
            os_ << '(';
        writeExpr(*b.left);
        if (wrapLeft)
            os_ << ')';
        os_ << ' ' << operatorToString(b.op) << ' ';
        writeExpr(*b.right);
    }

    // "-5" would lex as a negative literal, so negation of anything but a
    // plain variable is written as "-(...)".
    void writeUnary(const UnaryOp &u)
    {
        os_ << operatorToString(u.op);
        const bool wrap =
            u.op == Operator::Negate && !std::holds_alternative<Variable>(u.operand->node);
        if (wrap)
            os_ << '(';
        writeExpr(*u.operand);
        if (wrap)
            os_ << ')';
    }

    void writeList(const std::vector<Expr> &exprs)
    {
        for (size_t i = 0; i < exprs.size(); ++i)
        {
            if (i != 0)
                os_ << ", ";
            writeExpr(exprs[i]);
        }
    }

    void writeAssignment(const Assignment &a)
    {
        for (size_t i = 0; i < a.targets.size(); ++i)
        {
            if (i != 0)
                os_ << ", ";
            writeVariable(a.targets[i]);
        }
        os_ << " = ";
        writeList(a.values);
    }

    void writeBody(const Block &block)
    {
        os_ << "{\n";
        ++depth_;
        writeStatements(block);
        --depth_;
        indent();
        os_ << '}';
    }

    void writeStmt(const Stmt &stmt)
    {
        indent();
        std::visit(Overload{[&](const Assignment &a) { writeAssignment(a); },
                            [&](const Condition &c)
                            {
                                os_ << "if ";
                                writeExpr(c.test);
                                os_ << ' ';
                                writeBody(c.thenBlock);
                                if (!c.elseBlock.statements.empty())
                                {
                                    os_ << " else ";
                                    writeBody(c.elseBlock);
                                }
                            },
                            [&](const Loop &l)
                            {
                                os_ << "for ";
                                if (!l.init.empty())
                                    writeAssignment(l.init);
                                os_ << "; ";
                                writeList(l.tests);
                                os_ << "; ";
                                if (!l.step.empty())
                                {
                                    writeAssignment(l.step);
                                    os_ << ' ';
                                }
                                writeBody(l.body);
                            },
                            [&](const Block &b) { writeBody(b); }},
                   stmt.node);
        os_ << '\n';
    }

    std::ostringstream os_;
    int depth_ = 0;
};

std::string typeSuffix(Type type)
{
    return std::string(" : ") + typeToString(type);
}

} // namespace

std::string toSource(const Program &program)
{
    return toSource(program.root);
}

std::string toSource(const Block &block)
{
    SourceWriter w;
    w.writeStatements(block);
    return w.take();
}

std::string toSource(const Expr &expr)
{
    SourceWriter w;
    w.writeExpr(expr);
    return w.take();
}

//===----------------------------------------------------------------------===//
// Dump form
//===----------------------------------------------------------------------===//

std::string AstPrinter::dump(const Program &program)
{
    out_.clear();
    indent_ = 0;
    printBlock("Program", program.root);
    return out_;
}

std::string AstPrinter::dump(const Expr &expr)
{
    out_.clear();
    indent_ = 0;
    printExpr("", expr);
    return out_;
}

void AstPrinter::line(const std::string &text)
{
    out_.append(static_cast<size_t>(indent_) * 2, ' ');
    out_ += text;
    out_ += '\n';
}

void AstPrinter::printBlock(const char *label, const Block &block)
{
    std::string head = label;
    if (block.scope != kNoScope)
        head += " (scope " + std::to_string(block.scope) + ")";
    line(head);
    ++indent_;
    for (const auto &stmt : block.statements)
        printStmt(stmt);
    --indent_;
}

void AstPrinter::printAssignment(const char *label, const Assignment &assign)
{
    if (assign.empty())
    {
        line(std::string(label) + " <none>");
        return;
    }
    line(label);
    ++indent_;
    for (const auto &target : assign.targets)
    {
        std::string text = "Target: ";
        if (target.isShadowDeclaration)
            text += "shadow ";
        text += target.name + typeSuffix(target.type);
        if (!target.storage.empty())
            text += " [" + target.storage + "]";
        line(text);
    }
    for (const auto &value : assign.values)
        printExpr("Value: ", value);
    --indent_;
}

void AstPrinter::printStmt(const Stmt &stmt)
{
    std::visit(Overload{[&](const Assignment &a) { printAssignment("Assignment", a); },
                        [&](const Condition &c)
                        {
                            line("Condition");
                            ++indent_;
                            printExpr("Test: ", c.test);
                            printBlock("Then", c.thenBlock);
                            printBlock("Else", c.elseBlock);
                            --indent_;
                        },
                        [&](const Loop &l)
                        {
                            line("Loop");
                            ++indent_;
                            printAssignment("Init", l.init);
                            for (const auto &test : l.tests)
                                printExpr("Test: ", test);
                            printAssignment("Step", l.step);
                            printBlock("Body", l.body);
                            --indent_;
                        },
                        [&](const Block &b) { printBlock("Block", b); }},
               stmt.node);
}

void AstPrinter::printExpr(const char *label, const Expr &expr)
{
    std::visit(Overload{[&](const Variable &v)
                        {
                            std::string text = std::string(label) + "Variable ";
                            if (v.isShadowDeclaration)
                                text += "shadow ";
                            line(text + v.name + typeSuffix(v.type));
                        },
                        [&](const Constant &c)
                        { line(std::string(label) + "Constant " + c.literal + typeSuffix(c.type)); },
                        [&](const BinaryOp &b)
                        {
                            line(std::string(label) + "BinaryOp " + operatorToString(b.op) +
                                 typeSuffix(b.resultType));
                            ++indent_;
                            printExpr("", *b.left);
                            printExpr("", *b.right);
                            --indent_;
                        },
                        [&](const UnaryOp &u)
                        {
                            line(std::string(label) + "UnaryOp " +
                                 (u.op == Operator::Negate ? "neg" : "not") +
                                 typeSuffix(u.resultType));
                            ++indent_;
                            printExpr("", *u.operand);
                            --indent_;
                        }},
               expr.node);
}

} // namespace shade::frontend
