//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the shadec command-line tool.
//
//===----------------------------------------------------------------------===//

#include "tools/shadec/cli.hpp"
#include "tools/shadec/usage.hpp"

#include <iostream>

/// @brief Main entry point for shadec.
/// @return 0 on success, 1 on any usage, compile or toolchain error.
int main(int argc, char **argv)
{
    if (argc < 2)
    {
        shadec::printUsage(std::cerr);
        return 1;
    }

    const shadec::CliParseResult parsed = shadec::parseArgs(argc, argv);
    switch (parsed.action)
    {
        case shadec::CliAction::Help:
            shadec::printUsage(std::cout);
            return 0;
        case shadec::CliAction::Version:
            shadec::printVersion(std::cout);
            return 0;
        case shadec::CliAction::Error:
            std::cerr << "error: " << parsed.error << "\n\n";
            shadec::printUsage(std::cerr);
            return 1;
        case shadec::CliAction::Compile:
            break;
    }
    return shadec::runCompiler(parsed.options, std::cout, std::cerr);
}
