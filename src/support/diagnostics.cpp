//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine.  Every pass reports into one engine; it
// keeps messages in order, tracks severity counts and prints them on demand.
// Notes double as the compiler's progress log when --verbose is given.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <algorithm>

namespace shade::support
{
const char *errorKindToString(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::None:
            return "note";
        case ErrorKind::Lexical:
            return "lexical error";
        case ErrorKind::Parse:
            return "parse error";
        case ErrorKind::Scope:
            return "scope error";
        case ErrorKind::Type:
            return "type error";
        case ErrorKind::Toolchain:
            return "toolchain error";
        case ErrorKind::Internal:
            return "internal error";
    }
    return "";
}

/// @brief Adds a diagnostic to the engine and updates severity counters.
///
/// Notes leave both counters unchanged.
///
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Writes all stored diagnostics to the provided output stream.
///
/// Formatting is delegated to `printDiag` so a diagnostic prints the same way
/// whether it travels through the engine or inside an Expected.
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

const Diagnostic *DiagnosticEngine::firstError() const
{
    for (const auto &d : diags_)
    {
        if (d.severity == Severity::Error)
            return &d;
    }
    return nullptr;
}

void DiagnosticEngine::discard(ErrorKind kind)
{
    auto removed = std::remove_if(diags_.begin(),
                                  diags_.end(),
                                  [kind](const Diagnostic &d) { return d.kind == kind; });
    diags_.erase(removed, diags_.end());

    errors_ = 0;
    warnings_ = 0;
    for (const auto &d : diags_)
    {
        if (d.severity == Severity::Error)
            ++errors_;
        else if (d.severity == Severity::Warning)
            ++warnings_;
    }
}
} // namespace shade::support
