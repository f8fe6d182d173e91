//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/CodeGenerator.cpp
// Purpose: Document skeleton, variable storage and literal pools.
// Key invariants: Literal pool labels are numbered in first-use order per
//                 kind; storage is declared in symbol table order.
// Ownership/Lifetime: See CodeGenerator.hpp.
// Links: codegen/x86_64/AsmDocument.hpp
//
//===----------------------------------------------------------------------===//

#include "codegen/x86_64/CodeGenerator.hpp"

#include <stdexcept>
#include <utility>

namespace shade::codegen::x64
{

using frontend::Type;

support::Expected<AsmDocument> CodeGenerator::generate(const frontend::Program &program)
{
    doc_ = AsmDocument{};
    labels_ = common::LabelAllocator{};
    error_.reset();
    intPool_.clear();
    boolPool_.clear();
    floatPool_.clear();
    stringPool_.clear();

    emitHeader();
    declareStorage(program);
    if (failed())
        return *error_;

    instr("section", ".text");
    doc_.addLabel("_start");
    instr("and", "rsp, -16");

    emitBlock(program.root);
    if (failed())
        return *error_;

    instr("xor", "edi, edi");
    instr("call", "exit wrt ..plt");
    return std::move(doc_);
}

void CodeGenerator::emitHeader()
{
    doc_.addHeader("bits 64");
    doc_.addHeader("default rel");
    doc_.addHeader("extern exit");
    doc_.addHeader("global _start");
    doc_.addHeader("section .data");
}

void CodeGenerator::declareStorage(const frontend::Program &program)
{
    for (frontend::ScopeId id = 0; id < program.tables.size(); ++id)
    {
        const frontend::SymbolTable &table = program.tables.at(id);
        for (const auto &name : table.names())
        {
            const frontend::SymbolEntry *entry = table.find(name);
            if (!entry || entry->storage.empty())
            {
                fail({}, "variable '" + name + "' has no storage symbol");
                return;
            }
            switch (entry->type)
            {
                case Type::Int:
                case Type::Bool:
                    doc_.addVariable(entry->storage, "dq", "0");
                    break;
                case Type::Float:
                    doc_.addVariable(entry->storage, "dq", "0.0");
                    break;
                case Type::String:
                    doc_.addVariable(entry->storage, "dq", "0");
                    doc_.addVariable(entry->storage + "_len", "dq", "0");
                    break;
                case Type::Unknown:
                    fail(entry->declLoc, "variable '" + name + "' has unknown type");
                    return;
            }
        }
    }
}

std::string CodeGenerator::intConstant(const std::string &literal)
{
    auto it = intPool_.find(literal);
    if (it != intPool_.end())
        return it->second;
    std::string name = "k_int_" + std::to_string(intPool_.size());
    doc_.addConstant(name, literal);
    intPool_.emplace(literal, name);
    return name;
}

std::string CodeGenerator::boolConstant(const std::string &literal)
{
    auto it = boolPool_.find(literal);
    if (it != boolPool_.end())
        return it->second;
    std::string name = "k_bool_" + std::to_string(boolPool_.size());
    doc_.addConstant(name, literal == "true" ? "1" : "0");
    boolPool_.emplace(literal, name);
    return name;
}

std::string CodeGenerator::floatLiteral(const std::string &literal)
{
    auto it = floatPool_.find(literal);
    if (it != floatPool_.end())
        return it->second;
    std::string name = "k_flt_" + std::to_string(floatPool_.size());
    std::string value = literal;
    // "3." is a valid Shade literal; spell it "3.0" for the assembler.
    if (!value.empty() && value.back() == '.')
        value.push_back('0');
    doc_.addVariable(name, "dq", value);
    floatPool_.emplace(literal, name);
    return name;
}

std::string CodeGenerator::stringLiteral(const std::string &literal)
{
    auto it = stringPool_.find(literal);
    if (it != stringPool_.end())
        return it->second;
    std::string name = "k_str_" + std::to_string(stringPool_.size());
    const size_t length = literal.size() >= 2 ? literal.size() - 2 : 0;
    if (length == 0)
        doc_.addVariable(name, "db", "0");
    else
        doc_.addVariable(name, "db", literal + ", 0");
    doc_.addConstant(name + "_len", std::to_string(length));
    stringPool_.emplace(literal, name);
    return name;
}

void CodeGenerator::instr(std::string mnemonic, std::string operands)
{
    doc_.addInstr(std::move(mnemonic), std::move(operands));
}

void CodeGenerator::fail(support::SourceLoc loc, std::string message)
{
    if (error_)
        return;
    error_ = support::makeError(
        loc, "internal error: " + std::move(message), "I1000", support::ErrorKind::Internal);
}

const char *conditionSuffix(frontend::Operator op, bool isUnsigned)
{
    using frontend::Operator;
    switch (op)
    {
        case Operator::Eq:
            return "e";
        case Operator::Ne:
            return "ne";
        case Operator::Le:
            return isUnsigned ? "be" : "le";
        case Operator::Ge:
            return isUnsigned ? "ae" : "ge";
        case Operator::Less:
            return isUnsigned ? "b" : "l";
        case Operator::Greater:
            return isUnsigned ? "a" : "g";
        default:
            break;
    }
    throw std::logic_error(std::string("operator '") + frontend::operatorToString(op) +
                           "' is not a comparison");
}

} // namespace shade::codegen::x64
