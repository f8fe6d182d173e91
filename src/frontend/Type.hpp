//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Type.hpp
// Purpose: Value types and operators of the Shade language.
// Key invariants: Unknown only appears before analysis or on erroneous nodes.
// Ownership/Lifetime: Plain enums.
// Links: frontend/AST.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string_view>

namespace shade::frontend
{

/// @brief Scalar value types.
enum class Type
{
    Int,
    Float,
    String,
    Bool,
    Unknown
};

/// @brief Lowercase type name ("int", "float", ...).
const char *typeToString(Type type);

/// @brief Binary and unary operators.
enum class Operator
{
    Plus,
    Minus,
    Mult,
    Div,
    Eq,
    Ne,
    Le,
    Ge,
    Less,
    Greater,
    And,
    Or,
    Negate,
    Not
};

/// @brief Source spelling of @p op; Negate prints as "-".
const char *operatorToString(Operator op);

/// @brief Map a binary operator spelling to its enumerator.
std::optional<Operator> binaryOperatorFromText(std::string_view text);

/// @brief Map a unary operator spelling ("-" or "!") to its enumerator.
std::optional<Operator> unaryOperatorFromText(std::string_view text);

[[nodiscard]] bool isArithmetic(Operator op);
[[nodiscard]] bool isComparison(Operator op);
[[nodiscard]] bool isLogical(Operator op);

} // namespace shade::frontend
