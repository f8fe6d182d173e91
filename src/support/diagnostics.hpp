//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record and the engine collecting them.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace shade::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Compiler stage that produced a diagnostic.
enum class ErrorKind
{
    None,      ///< Notes and progress messages
    Lexical,   ///< Unrecognized character or malformed literal text
    Parse,     ///< Token sequence violates the grammar
    Scope,     ///< Redeclaration or unresolved identifier
    Type,      ///< Operator, assignment or condition type mismatch
    Toolchain, ///< Assembler or linker missing or failing
    Internal   ///< Broken invariant inside the compiler
};

/// @brief Lowercase name of @p kind, e.g. "type error".
const char *errorKindToString(ErrorKind kind);

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;                ///< Message severity
    std::string message;              ///< Human-readable text
    SourceLoc loc;                    ///< Optional source location
    std::string code;                 ///< Stable identifier such as "T1001"; may be empty
    ErrorKind kind = ErrorKind::None; ///< Producing stage
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    /// @param sm Optional source manager for paths and caret lines.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief All diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief First error-severity diagnostic, or nullptr.
    const Diagnostic *firstError() const;

    /// @brief Drop every recorded diagnostic of kind @p kind.
    /// @details Used by the driver to discard parse errors manufactured by a
    ///          token stream that ended early after a lexical error.
    void discard(ErrorKind kind);

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};
} // namespace shade::support
