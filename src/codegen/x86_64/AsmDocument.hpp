//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/AsmDocument.hpp
// Purpose: In-memory NASM/yasm assembly document with four ordered sections.
// Key invariants: Sections render in the order header, constants, variables,
//                 program; entries keep insertion order within a section.
// Ownership/Lifetime: Value type owning all of its text.
// Links: codegen/x86_64/CodeGenerator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace shade::codegen::x64
{

/// @brief `name equ value`.
struct AsmConstant
{
    std::string name;
    std::string value;
};

/// @brief `name directive value`, e.g. `var_x_0 dq 0`.
struct AsmVariable
{
    std::string name;
    std::string directive;
    std::string value;
};

/// @brief One program line: a label, an instruction, or both empty-labelled.
struct AsmLine
{
    std::string label;
    std::string mnemonic;
    std::string operands;
};

class AsmDocument
{
  public:
    void addHeader(std::string line);
    void addConstant(std::string name, std::string value);
    void addVariable(std::string name, std::string directive, std::string value);

    /// @brief Append a label definition to the program section.
    void addLabel(std::string label);

    /// @brief Append an instruction to the program section.
    void addInstr(std::string mnemonic, std::string operands = {});

    const std::vector<std::string> &header() const
    {
        return header_;
    }

    const std::vector<AsmConstant> &constants() const
    {
        return constants_;
    }

    const std::vector<AsmVariable> &variables() const
    {
        return variables_;
    }

    const std::vector<AsmLine> &program() const
    {
        return program_;
    }

    /// @brief Write the document as assembler source.
    void render(std::ostream &os) const;

    /// @brief Render into a string.
    std::string str() const;

  private:
    std::vector<std::string> header_;
    std::vector<AsmConstant> constants_;
    std::vector<AsmVariable> variables_;
    std::vector<AsmLine> program_;
};

} // namespace shade::codegen::x64
