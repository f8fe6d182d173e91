//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements help text and usage information for the shadec command-line tool.
//
//===----------------------------------------------------------------------===//

#include "tools/shadec/usage.hpp"
#include "shade/version.hpp"

namespace shadec
{

void printVersion(std::ostream &os)
{
    os << "shadec v" << SHADE_VERSION_STR << "\n";
    os << "Shade compiler for x86-64 Linux\n";
}

void printUsage(std::ostream &os)
{
    os << "shadec v" << SHADE_VERSION_STR << " - Shade compiler\n"
       << "\n"
       << "Usage: shadec [options] <file.shd>\n"
       << "\n"
       << "Usage Modes:\n"
       << "  shadec prog.shd                  Build ./a.out\n"
       << "  shadec prog.shd -o prog          Build ./prog\n"
       << "  shadec prog.shd -S               Print assembly to stdout\n"
       << "  shadec prog.shd -S -o prog.s     Write assembly to prog.s\n"
       << "\n"
       << "Options:\n"
       << "  -o, --output FILE              Output file (default a.out)\n"
       << "  -S                             Stop after code generation\n"
       << "  --emit-asm FILE                Keep the assembly in FILE\n"
       << "  --dump-tokens                  Print the token stream and stop\n"
       << "  --dump-ast                     Print the parsed program and stop\n"
       << "  --dump-typed-ast               Print the typed AST and stop\n"
       << "  --assembler PATH               Assembler to run (default yasm)\n"
       << "  --linker PATH                  Linker to run (default ld)\n"
       << "  --no-pipeline                  Lex on demand instead of on a thread\n"
       << "  -v, --verbose                  Report progress on stderr\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Examples:\n"
       << "  shadec fib.shd -o fib                     Build an executable\n"
       << "  shadec fib.shd --emit-asm fib.s -o fib    Build and keep assembly\n"
       << "  shadec fib.shd --assembler nasm           Assemble with nasm\n";
}

} // namespace shadec
