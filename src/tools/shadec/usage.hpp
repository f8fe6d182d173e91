//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/shadec/usage.hpp
// Purpose: Declarations for shadec help and usage text.
// Key invariants: None.
// Ownership/Lifetime: N/A.
// Links: tools/shadec/cli.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace shadec
{

/// @brief Print usage information for the shadec command-line tool.
void printUsage(std::ostream &os);

/// @brief Print version information for shadec.
void printVersion(std::ostream &os);

} // namespace shadec
