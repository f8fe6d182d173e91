//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/CodeGen_Expr.cpp
// Purpose: Stack-machine lowering of expressions.
// Key invariants: Operands are evaluated left then right, so the right
//                 operand is on top of the stack when the operator runs.
//                 Int and bool values are 64-bit integers (bool is 0 or 1);
//                 floats travel as raw IEEE-754 bit patterns.
// Ownership/Lifetime: See CodeGenerator.hpp.
// Links: codegen/x86_64/CodeGenerator.hpp
//
//===----------------------------------------------------------------------===//

#include "codegen/x86_64/CodeGenerator.hpp"

namespace shade::codegen::x64
{

using frontend::Operator;
using frontend::Type;

void CodeGenerator::emitExpr(const frontend::Expr &expr)
{
    if (failed())
        return;
    std::visit(frontend::Overload{[&](const frontend::Variable &v) { emitVariable(v); },
                                  [&](const frontend::Constant &c) { emitConstant(c); },
                                  [&](const frontend::BinaryOp &b) { emitBinary(b); },
                                  [&](const frontend::UnaryOp &u) { emitUnary(u); }},
               expr.node);
}

void CodeGenerator::emitVariable(const frontend::Variable &var)
{
    if (var.type == Type::Unknown || var.storage.empty())
    {
        fail(var.loc, "variable '" + var.name + "' was not resolved");
        return;
    }
    instr("push", "qword [" + var.storage + "]");
    if (var.type == Type::String)
        instr("push", "qword [" + var.storage + "_len]");
}

void CodeGenerator::emitConstant(const frontend::Constant &constant)
{
    switch (constant.type)
    {
        case Type::Int:
            instr("mov", "rax, " + intConstant(constant.literal));
            instr("push", "rax");
            break;
        case Type::Bool:
            instr("mov", "rax, " + boolConstant(constant.literal));
            instr("push", "rax");
            break;
        case Type::Float:
            instr("push", "qword [" + floatLiteral(constant.literal) + "]");
            break;
        case Type::String:
        {
            const std::string label = stringLiteral(constant.literal);
            instr("lea", "rax, [" + label + "]");
            instr("push", "rax");
            instr("mov", "rax, " + label + "_len");
            instr("push", "rax");
            break;
        }
        case Type::Unknown:
            fail(constant.loc, "literal '" + constant.literal + "' has unknown type");
            break;
    }
}

void CodeGenerator::emitUnary(const frontend::UnaryOp &unary)
{
    emitExpr(*unary.operand);
    if (failed())
        return;

    instr("pop", "rax");
    switch (unary.resultType)
    {
        case Type::Int:
            instr("neg", "rax");
            break;
        case Type::Float:
            instr("btc", "rax, 63");
            break;
        case Type::Bool:
            instr("xor", "rax, 1");
            break;
        default:
            fail(unary.loc,
                 std::string("operator '") + frontend::operatorToString(unary.op) +
                     "' has no lowering for type " + frontend::typeToString(unary.resultType));
            return;
    }
    instr("push", "rax");
}

void CodeGenerator::emitBinary(const frontend::BinaryOp &binary)
{
    emitExpr(*binary.left);
    emitExpr(*binary.right);
    if (failed())
        return;

    const Type operand = frontend::exprType(*binary.left);
    if (binary.resultType == Type::Unknown || operand == Type::Unknown)
    {
        fail(binary.loc,
             std::string("operator '") + frontend::operatorToString(binary.op) +
                 "' was not typed");
        return;
    }

    switch (operand)
    {
        case Type::Int:
        case Type::Bool:
            emitIntBinary(binary.op);
            break;
        case Type::Float:
            emitFloatBinary(binary.op);
            break;
        case Type::String:
            if (!frontend::isComparison(binary.op))
            {
                fail(binary.loc,
                     std::string("operator '") + frontend::operatorToString(binary.op) +
                         "' has no lowering for strings");
                return;
            }
            emitStringCompare(binary.op);
            break;
        case Type::Unknown:
            break;
    }
}

void CodeGenerator::emitIntBinary(Operator op)
{
    instr("pop", "rcx");
    instr("pop", "rax");
    switch (op)
    {
        case Operator::Plus:
            instr("add", "rax, rcx");
            break;
        case Operator::Minus:
            instr("sub", "rax, rcx");
            break;
        case Operator::Mult:
            instr("imul", "rax, rcx");
            break;
        case Operator::Div:
            instr("cqo");
            instr("idiv", "rcx");
            break;
        case Operator::And:
            instr("and", "rax, rcx");
            break;
        case Operator::Or:
            instr("or", "rax, rcx");
            break;
        default:
            instr("cmp", "rax, rcx");
            instr(std::string("set") + conditionSuffix(op, false), "al");
            instr("movzx", "rax, al");
            break;
    }
    instr("push", "rax");
}

void CodeGenerator::emitFloatBinary(Operator op)
{
    instr("pop", "rcx");
    instr("pop", "rax");
    instr("movq", "xmm0, rax");
    instr("movq", "xmm1, rcx");
    switch (op)
    {
        case Operator::Plus:
            instr("addsd", "xmm0, xmm1");
            instr("movq", "rax, xmm0");
            break;
        case Operator::Minus:
            instr("subsd", "xmm0, xmm1");
            instr("movq", "rax, xmm0");
            break;
        case Operator::Mult:
            instr("mulsd", "xmm0, xmm1");
            instr("movq", "rax, xmm0");
            break;
        case Operator::Div:
            instr("divsd", "xmm0, xmm1");
            instr("movq", "rax, xmm0");
            break;
        default:
            instr("ucomisd", "xmm0, xmm1");
            instr(std::string("set") + conditionSuffix(op, true), "al");
            instr("movzx", "rax, al");
            break;
    }
    instr("push", "rax");
}

// Stack on entry: left ptr, left len, right ptr, right len (top).
// The common prefix is compared byte-wise; when it matches the lengths
// decide.  Both paths leave unsigned flags for left relative to right.
void CodeGenerator::emitStringCompare(Operator op)
{
    const std::string done = common::LabelAllocator::make("L_str_done", labels_.reserve());
    instr("pop", "r9");
    instr("pop", "rdi");
    instr("pop", "rdx");
    instr("pop", "rsi");
    instr("mov", "rcx, rdx");
    instr("cmp", "rcx, r9");
    instr("cmova", "rcx, r9");
    instr("cld");
    instr("xor", "eax, eax");
    instr("repe", "cmpsb");
    instr("jne", done);
    instr("cmp", "rdx, r9");
    doc_.addLabel(done);
    instr(std::string("set") + conditionSuffix(op, true), "al");
    instr("movzx", "rax, al");
    instr("push", "rax");
}

} // namespace shade::codegen::x64
