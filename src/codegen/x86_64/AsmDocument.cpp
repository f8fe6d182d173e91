//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/AsmDocument.cpp
// Purpose: Section bookkeeping and column-aligned rendering.
//
//===----------------------------------------------------------------------===//

#include "codegen/x86_64/AsmDocument.hpp"

#include <algorithm>
#include <sstream>

namespace shade::codegen::x64
{

namespace
{

constexpr const char *kIndent = "    ";
constexpr size_t kMnemonicWidth = 8;

void pad(std::ostream &os, size_t used, size_t width)
{
    for (size_t i = used; i < width; ++i)
        os << ' ';
}

} // namespace

void AsmDocument::addHeader(std::string line)
{
    header_.push_back(std::move(line));
}

void AsmDocument::addConstant(std::string name, std::string value)
{
    constants_.push_back(AsmConstant{std::move(name), std::move(value)});
}

void AsmDocument::addVariable(std::string name, std::string directive, std::string value)
{
    variables_.push_back(AsmVariable{std::move(name), std::move(directive), std::move(value)});
}

void AsmDocument::addLabel(std::string label)
{
    program_.push_back(AsmLine{std::move(label), {}, {}});
}

void AsmDocument::addInstr(std::string mnemonic, std::string operands)
{
    program_.push_back(AsmLine{{}, std::move(mnemonic), std::move(operands)});
}

void AsmDocument::render(std::ostream &os) const
{
    for (const auto &line : header_)
        os << line << '\n';

    if (!constants_.empty())
    {
        size_t width = 0;
        for (const auto &c : constants_)
            width = std::max(width, c.name.size());
        os << '\n';
        for (const auto &c : constants_)
        {
            os << c.name;
            pad(os, c.name.size(), width);
            os << " equ " << c.value << '\n';
        }
    }

    if (!variables_.empty())
    {
        size_t width = 0;
        for (const auto &v : variables_)
            width = std::max(width, v.name.size());
        os << '\n';
        for (const auto &v : variables_)
        {
            os << v.name;
            pad(os, v.name.size(), width);
            os << ' ' << v.directive << ' ' << v.value << '\n';
        }
    }

    os << '\n';
    for (const auto &line : program_)
    {
        if (!line.label.empty())
        {
            os << line.label << ":\n";
            continue;
        }
        os << kIndent << line.mnemonic;
        if (!line.operands.empty())
        {
            pad(os, line.mnemonic.size(), kMnemonicWidth);
            os << ' ' << line.operands;
        }
        os << '\n';
    }
}

std::string AsmDocument::str() const
{
    std::ostringstream os;
    render(os);
    return os.str();
}

} // namespace shade::codegen::x64
