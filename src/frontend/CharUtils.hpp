//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/CharUtils.hpp
// Purpose: Character classification utilities for the lexer.
//
// Classification is ASCII only; bytes outside the ASCII range never start
// a token and are reported as unrecognized characters.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace shade::frontend::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character can start an identifier.
/// @details Identifiers start with a letter only; '_' may only follow.
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return isLetter(c);
}

/// @brief Check if character can continue an identifier (letter, digit, or underscore).
[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isLetter(c) || isDigit(c) || c == '_';
}

/// @brief Check if character is ASCII whitespace.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/// @brief Check if character is printable ASCII (space through tilde).
[[nodiscard]] constexpr bool isPrintable(char c) noexcept
{
    return c >= ' ' && c <= '~';
}

} // namespace shade::frontend::char_utils
