//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/CodeGen_Stmt.cpp
// Purpose: Lowering of blocks, assignments, conditions and loops.
//
//===----------------------------------------------------------------------===//

#include "codegen/x86_64/CodeGenerator.hpp"

namespace shade::codegen::x64
{

using frontend::Type;

void CodeGenerator::emitBlock(const frontend::Block &block)
{
    for (const auto &stmt : block.statements)
    {
        emitStmt(stmt);
        if (failed())
            return;
    }
}

void CodeGenerator::emitStmt(const frontend::Stmt &stmt)
{
    std::visit(frontend::Overload{[&](const frontend::Assignment &a) { emitAssignment(a); },
                                  [&](const frontend::Condition &c) { emitCondition(c); },
                                  [&](const frontend::Loop &l) { emitLoop(l); },
                                  [&](const frontend::Block &b) { emitBlock(b); }},
               stmt.node);
}

void CodeGenerator::emitAssignment(const frontend::Assignment &assign)
{
    if (assign.targets.size() != assign.values.size())
    {
        fail(assign.loc, "assignment target and value counts differ");
        return;
    }

    for (const auto &value : assign.values)
        emitExpr(value);

    for (auto it = assign.targets.rbegin(); it != assign.targets.rend() && !failed(); ++it)
        storeTarget(*it);
}

void CodeGenerator::storeTarget(const frontend::Variable &target)
{
    if (target.type == Type::Unknown || target.storage.empty())
    {
        fail(target.loc, "assignment target '" + target.name + "' was not resolved");
        return;
    }
    if (target.type == Type::String)
        instr("pop", "qword [" + target.storage + "_len]");
    instr("pop", "qword [" + target.storage + "]");
}

void CodeGenerator::branchIfFalse(const std::string &label)
{
    instr("pop", "rax");
    instr("test", "rax, rax");
    instr("jz", label);
}

void CodeGenerator::emitCondition(const frontend::Condition &cond)
{
    const uint32_t id = labels_.reserve();
    const std::string elseLabel = common::LabelAllocator::make("L_if_else", id);
    const std::string endLabel = common::LabelAllocator::make("L_if_end", id);

    emitExpr(cond.test);
    if (failed())
        return;
    branchIfFalse(elseLabel);
    emitBlock(cond.thenBlock);
    instr("jmp", endLabel);
    doc_.addLabel(elseLabel);
    emitBlock(cond.elseBlock);
    doc_.addLabel(endLabel);
}

void CodeGenerator::emitLoop(const frontend::Loop &loop)
{
    const uint32_t id = labels_.reserve();
    const std::string topLabel = common::LabelAllocator::make("L_for_top", id);
    const std::string endLabel = common::LabelAllocator::make("L_for_end", id);

    emitAssignment(loop.init);
    doc_.addLabel(topLabel);
    for (const auto &test : loop.tests)
    {
        emitExpr(test);
        if (failed())
            return;
        branchIfFalse(endLabel);
    }
    emitBlock(loop.body);
    emitAssignment(loop.step);
    instr("jmp", topLabel);
    doc_.addLabel(endLabel);
}

} // namespace shade::codegen::x64
