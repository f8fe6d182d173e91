//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Load Shade source files for command-line tools.
// Key invariants: The returned buffer holds the complete file contents.
// Ownership/Lifetime: The caller owns the returned string.
// Links: tools/shadec/main.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>

namespace shade::tools::common
{

/// @brief Read @p path into memory.
///
/// Files larger than 256 MB are rejected before reading.
///
/// @param path Filesystem path to the source file.
/// @return File contents on success; otherwise an X1003 diagnostic describing
///         the I/O failure.
support::Expected<std::string> loadSourceFile(const std::string &path);

} // namespace shade::tools::common
