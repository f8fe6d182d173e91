//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/shadec/cli.hpp
// Purpose: Command-line parsing and the compile pipeline behind shadec.
// Key invariants: parseArgs never exits the process; main decides.
// Ownership/Lifetime: CliOptions is a plain value.
// Links: tools/shadec/main.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace shadec
{

/// @brief Configuration parsed from shadec command-line arguments.
struct CliOptions
{
    std::string sourcePath;
    std::string outputPath{"a.out"};
    bool outputGiven = false;
    /// @brief -S: stop after code generation.
    bool assemblyOnly = false;
    /// @brief --emit-asm FILE.
    std::optional<std::string> asmPath;
    bool dumpTokens = false;
    bool dumpAst = false;
    bool dumpTypedAst = false;
    std::string assembler{"yasm"};
    std::string linker{"ld"};
    bool pipelined = true;
    bool verbose = false;

    [[nodiscard]] bool dumpOnly() const
    {
        return dumpTokens || dumpAst || dumpTypedAst;
    }
};

/// @brief What main should do after parsing.
enum class CliAction
{
    Compile,
    Help,
    Version,
    Error
};

struct CliParseResult
{
    CliAction action = CliAction::Compile;
    CliOptions options{};
    std::string error{}; ///< Set when action is Error
};

/// @brief Parse shadec arguments; argv[0] is the program name.
CliParseResult parseArgs(int argc, char **argv);

/// @brief Run the compiler as configured.
/// @param out Receives dumps and -S assembly.
/// @param err Receives diagnostics and verbose notes.
/// @return Process exit status: 0 on success, 1 on any error.
int runCompiler(const CliOptions &options, std::ostream &out, std::ostream &err);

} // namespace shadec
