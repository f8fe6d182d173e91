//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.hpp
// Purpose: Declare process execution helpers used to drive the assembler and linker.
// Key invariants: RunResult captures exit codes and merged stdout/stderr text.
// Ownership/Lifetime: Callers own argument buffers; helper copies command text as needed.
// Links: codegen/common/Toolchain.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shade::common
{

/// @brief Result of launching a subprocess.
struct RunResult
{
    int exit_code;   ///< Normalised process exit code (or -1 on launch failure).
    std::string out; ///< Captured standard output text.
    std::string err; ///< Captured standard error text (merged with stdout).
};

/// @brief Spawn a subprocess using the provided argument vector.
/// @param argv Command-line arguments including the executable at index zero.
/// @return Captured process result including exit code and output streams.
RunResult run_process(const std::vector<std::string> &argv);

/// @brief Resolve @p program the way a shell would.
/// @details Names containing a '/' are checked directly; bare names are
///          searched in each directory of @p searchPath (PATH when empty).
/// @return Path to an executable file, or std::nullopt.
std::optional<std::string> find_program(std::string_view program,
                                        std::optional<std::string> searchPath = std::nullopt);

} // namespace shade::common
