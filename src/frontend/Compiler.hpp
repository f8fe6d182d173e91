//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Compiler.hpp
// Purpose: Front-end driver running lexing, parsing and semantic analysis.
// Key invariants: A lexical error replaces any parse error it caused.
// Ownership/Lifetime: The result owns the diagnostics and the typed Program.
// Links: frontend/Parser.hpp, frontend/SemanticAnalyzer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace shade::frontend
{

/// @brief Options controlling front-end behavior.
struct CompilerOptions
{
    /// @brief Run the lexer on a producer thread feeding the parser.
    bool pipelined{true};
    /// @brief Run semantic analysis after a successful parse.
    bool analyze{true};
    /// @brief Report progress notes into the diagnostic engine.
    bool verbose{false};
};

/// @brief Input parameters describing the source to compile.
struct CompilerInput
{
    /// @brief Shade source code to compile.
    std::string_view source;
    /// @brief Path used for diagnostics; defaults to "<input>".
    std::string_view path{"<input>"};
    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

/// @brief Aggregated result of the front end.
struct CompilerResult
{
    /// @brief Diagnostics accumulated during compilation.
    support::DiagnosticEngine diagnostics{};
    /// @brief File identifier used for the compiled source.
    uint32_t fileId{0};
    /// @brief Parsed (and, when analyzed is set, typed) program.
    std::optional<Program> program{};
    /// @brief Whether semantic analysis ran and succeeded.
    bool analyzed{false};

    /// @brief True when a fully typed program is available and no error was reported.
    [[nodiscard]] bool succeeded() const;
};

/// @brief Lex, parse and analyze @p input.
CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       support::SourceManager &sm);

} // namespace shade::frontend
