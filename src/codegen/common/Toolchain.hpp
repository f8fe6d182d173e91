//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/common/Toolchain.hpp
// Purpose: Drive the external assembler and linker on generated assembly.
// Key invariants: A failed build leaves no executable behind; temporary
//                 files are removed on every path.
// Ownership/Lifetime: Stateless functions; options are passed by reference.
// Links: common/RunProcess.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shade::codegen::common
{

/// @brief External tools and link inputs.
struct ToolchainOptions
{
    /// @brief Assembler name or path; "yasm" and "nasm" are understood.
    std::string assembler{"yasm"};
    std::string linker{"ld"};
    std::string dynamicLinker{"/lib64/ld-linux-x86-64.so.2"};
    /// @brief Libraries passed as -l<name>, in order.
    std::vector<std::string> libraries{"c"};
    /// @brief Keep the object file as "<exe>.o" instead of a temporary.
    bool keepObject{false};
    /// @brief Directory list used instead of PATH when locating tools.
    std::optional<std::string> searchPath{};
};

/// @brief Write assembly @p text to @p path.
/// @return X1003 when the file cannot be written.
support::Expected<void> writeAssembly(std::string_view text, const std::string &path);

/// @brief Resolve @p tool through the search path.
/// @return The executable path, or X1000 "'<tool>' not found".
support::Expected<std::string> locateTool(const std::string &tool,
                                          const ToolchainOptions &options);

/// @brief Command line that assembles @p asmPath into @p objPath.
std::vector<std::string> assemblerCommand(const std::string &assembler,
                                          const std::string &asmPath,
                                          const std::string &objPath);

/// @brief Command line that links @p objPath into @p exePath.
std::vector<std::string> linkerCommand(const std::string &linker,
                                       const ToolchainOptions &options,
                                       const std::string &objPath,
                                       const std::string &exePath);

/// @brief Assemble and link @p asmText into the executable @p exePath.
/// @param asmPath Where to keep the assembly; a temporary file when empty.
/// @return Success, or the first toolchain error (X1000-X1003).
support::Expected<void> buildExecutable(std::string_view asmText,
                                        const std::string &exePath,
                                        const std::optional<std::string> &asmPath,
                                        const ToolchainOptions &options);

} // namespace shade::codegen::common
