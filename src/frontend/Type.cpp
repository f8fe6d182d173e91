//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Type.cpp
// Purpose: Spelling tables and classification for types and operators.
//
//===----------------------------------------------------------------------===//

#include "frontend/Type.hpp"

#include <array>
#include <utility>

namespace shade::frontend
{

const char *typeToString(Type type)
{
    switch (type)
    {
        case Type::Int:
            return "int";
        case Type::Float:
            return "float";
        case Type::String:
            return "string";
        case Type::Bool:
            return "bool";
        case Type::Unknown:
            return "unknown";
    }
    return "unknown";
}

namespace
{
constexpr std::array<std::pair<std::string_view, Operator>, 12> kBinaryOperators = {{
    {"+", Operator::Plus},
    {"-", Operator::Minus},
    {"*", Operator::Mult},
    {"/", Operator::Div},
    {"==", Operator::Eq},
    {"!=", Operator::Ne},
    {"<=", Operator::Le},
    {">=", Operator::Ge},
    {"<", Operator::Less},
    {">", Operator::Greater},
    {"&&", Operator::And},
    {"||", Operator::Or},
}};
} // namespace

const char *operatorToString(Operator op)
{
    switch (op)
    {
        case Operator::Negate:
            return "-";
        case Operator::Not:
            return "!";
        default:
            break;
    }
    for (const auto &[text, candidate] : kBinaryOperators)
    {
        if (candidate == op)
            return text.data();
    }
    return "?";
}

std::optional<Operator> binaryOperatorFromText(std::string_view text)
{
    for (const auto &[spelling, op] : kBinaryOperators)
    {
        if (spelling == text)
            return op;
    }
    return std::nullopt;
}

std::optional<Operator> unaryOperatorFromText(std::string_view text)
{
    if (text == "-")
        return Operator::Negate;
    if (text == "!")
        return Operator::Not;
    return std::nullopt;
}

bool isArithmetic(Operator op)
{
    return op == Operator::Plus || op == Operator::Minus || op == Operator::Mult ||
           op == Operator::Div;
}

bool isComparison(Operator op)
{
    switch (op)
    {
        case Operator::Eq:
        case Operator::Ne:
        case Operator::Le:
        case Operator::Ge:
        case Operator::Less:
        case Operator::Greater:
            return true;
        default:
            return false;
    }
}

bool isLogical(Operator op)
{
    return op == Operator::And || op == Operator::Or;
}

} // namespace shade::frontend
