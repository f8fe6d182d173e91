//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the
// compiler.  The utilities defined here wrap structured diagnostics around an
// Expected<void> type, map severities to text, and print diagnostics with
// optional source context so every pass reports errors in one format.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace shade::support
{
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Success is indicated by the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc, {}, ErrorKind::None};
}

Diag makeError(SourceLoc loc, std::string msg, std::string code, ErrorKind kind)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code), kind};
}

Diag makeNote(std::string msg)
{
    return Diag{Severity::Note, std::move(msg), {}, {}, ErrorKind::None};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a valid location is available the message is prefixed with
///          "<path>:<line>:<column>:" following the common compiler style.
///          If the source manager also holds the file's text, the offending
///          line is echoed with a caret under the reported column.  Tabs in
///          the echoed prefix are preserved so the caret lines up.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.file_id != 0)
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.line != 0)
            {
                os << ':' << diag.loc.line;
                if (diag.loc.column != 0)
                {
                    os << ':' << diag.loc.column;
                }
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';

    if (!sm || !diag.loc.hasLine())
        return;
    const std::string_view line = sm->getLine(diag.loc.file_id, diag.loc.line);
    if (line.empty())
        return;
    os << "  " << line << '\n';
    if (diag.loc.hasColumn() && diag.loc.column <= line.size() + 1)
    {
        std::string marker = "  ";
        for (uint32_t i = 1; i < diag.loc.column; ++i)
            marker.push_back(line[i - 1] == '\t' ? '\t' : ' ');
        marker.push_back('^');
        os << marker << '\n';
    }
}
} // namespace shade::support
