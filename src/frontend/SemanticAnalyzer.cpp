//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/SemanticAnalyzer.cpp
// Purpose: Statement-level analysis: blocks, assignments, conditions, loops.
// Key invariants: Assignment values are typed before any target is bound;
//                 loop headers live in the enclosing block's scope.
// Ownership/Lifetime: See SemanticAnalyzer.hpp.
// Links: frontend/SemanticAnalyzer.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/SemanticAnalyzer.hpp"

#include <unordered_set>
#include <vector>

namespace shade::frontend
{

SemanticAnalyzer::SemanticAnalyzer(support::DiagnosticEngine &diag) : diag_(diag) {}

support::Expected<void> SemanticAnalyzer::analyze(Program &program)
{
    program_ = &program;
    first_.reset();
    errors_ = 0;
    aborted_ = false;

    if (!program.tables.contains(program.globalScope))
        critical({}, "program has no global symbol table");
    else
        analyzeBlock(program.root);

    program_ = nullptr;
    if (first_)
        return *first_;
    return {};
}

//===----------------------------------------------------------------------===//
// Reporting
//===----------------------------------------------------------------------===//

void SemanticAnalyzer::error(support::SourceLoc loc,
                             std::string message,
                             const char *code,
                             support::ErrorKind kind)
{
    ++errors_;
    auto d = support::makeError(loc, std::move(message), code, kind);
    if (!first_)
        first_ = d;
    diag_.report(std::move(d));
}

void SemanticAnalyzer::critical(support::SourceLoc loc, std::string message)
{
    error(loc, "malformed program: " + std::move(message), "I1000", support::ErrorKind::Internal);
    aborted_ = true;
}

std::string SemanticAnalyzer::allocateStorage(const std::string &name)
{
    return "var_" + name + "_" + std::to_string(storageCounter_++);
}

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

void SemanticAnalyzer::analyzeBlock(Block &block)
{
    if (!program_->tables.contains(block.scope) ||
        program_->tables.at(block.scope).parent() != block.parentScope)
    {
        critical(block.loc, "block without a symbol table chained to its parent");
        return;
    }

    for (auto &stmt : block.statements)
    {
        analyzeStmt(stmt, block.scope);
        if (aborted_)
            return;
    }
}

void SemanticAnalyzer::analyzeStmt(Stmt &stmt, ScopeId scope)
{
    std::visit(Overload{[&](Assignment &a) { analyzeAssignment(a, scope); },
                        [&](Condition &c) { analyzeCondition(c, scope); },
                        [&](Loop &l) { analyzeLoop(l, scope); },
                        [&](Block &b)
                        {
                            if (b.parentScope != scope)
                            {
                                critical(b.loc, "nested block chained to the wrong scope");
                                return;
                            }
                            analyzeBlock(b);
                        }},
               stmt.node);
}

void SemanticAnalyzer::analyzeAssignment(Assignment &assign, ScopeId scope)
{
    if (assign.targets.size() != assign.values.size())
    {
        critical(assign.loc,
                 "assignment with " + std::to_string(assign.targets.size()) + " target(s) and " +
                     std::to_string(assign.values.size()) + " value(s)");
        return;
    }

    // All right-hand sides read the bindings as they were before this statement.
    std::vector<Type> valueTypes;
    valueTypes.reserve(assign.values.size());
    for (auto &value : assign.values)
        valueTypes.push_back(analyzeExpr(value, scope));

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < assign.targets.size(); ++i)
    {
        Variable &target = assign.targets[i];
        if (!seen.insert(target.name).second)
        {
            error(target.loc,
                  "variable '" + target.name + "' is assigned more than once in one assignment",
                  "S1003",
                  support::ErrorKind::Scope);
            continue;
        }
        bindTarget(target, valueTypes[i], scope);
    }
}

void SemanticAnalyzer::bindTarget(Variable &target, Type valueType, ScopeId scope)
{
    SymbolTable &table = program_->tables.at(scope);

    if (target.isShadowDeclaration)
    {
        if (const SymbolEntry *existing = table.find(target.name))
        {
            error(target.loc,
                  "'" + target.name + "' is already declared in this block (line " +
                      std::to_string(existing->declLoc.line) + ")",
                  "S1001",
                  support::ErrorKind::Scope);
            target.type = existing->type;
            target.storage = existing->storage;
            return;
        }
        SymbolEntry entry{valueType, true, allocateStorage(target.name), target.loc};
        target.type = entry.type;
        target.storage = entry.storage;
        table.declare(target.name, std::move(entry));
        return;
    }

    if (SymbolEntry *entry = program_->tables.lookup(scope, target.name))
    {
        // A binding created by an erroneous statement takes its first real type.
        if (entry->type == Type::Unknown)
            entry->type = valueType;
        else if (valueType != Type::Unknown && valueType != entry->type)
            error(target.loc,
                  std::string("cannot assign ") + typeToString(valueType) + " value to '" +
                      target.name + "' of type " + typeToString(entry->type),
                  "T1001",
                  support::ErrorKind::Type);
        target.type = entry->type;
        target.storage = entry->storage;
        return;
    }

    SymbolEntry entry{valueType, false, allocateStorage(target.name), target.loc};
    target.type = entry.type;
    target.storage = entry.storage;
    table.declare(target.name, std::move(entry));
}

void SemanticAnalyzer::requireBool(const Expr &expr, Type type, const char *what)
{
    if (type == Type::Unknown || type == Type::Bool)
        return;
    error(exprLoc(expr),
          std::string(what) + " must be bool, got " + typeToString(type),
          "T1002",
          support::ErrorKind::Type);
}

void SemanticAnalyzer::analyzeCondition(Condition &cond, ScopeId scope)
{
    const Type testType = analyzeExpr(cond.test, scope);
    requireBool(cond.test, testType, "if condition");

    for (Block *branch : {&cond.thenBlock, &cond.elseBlock})
    {
        if (branch->parentScope != scope)
        {
            critical(branch->loc, "if branch chained to the wrong scope");
            return;
        }
        analyzeBlock(*branch);
        if (aborted_)
            return;
    }
}

void SemanticAnalyzer::analyzeLoop(Loop &loop, ScopeId scope)
{
    analyzeAssignment(loop.init, scope);
    if (aborted_)
        return;

    for (auto &test : loop.tests)
    {
        const Type testType = analyzeExpr(test, scope);
        requireBool(test, testType, "loop condition");
    }

    analyzeAssignment(loop.step, scope);
    if (aborted_)
        return;

    if (loop.body.parentScope != scope)
    {
        critical(loop.body.loc, "loop body chained to the wrong scope");
        return;
    }
    analyzeBlock(loop.body);
}

} // namespace shade::frontend
