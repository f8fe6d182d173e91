//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/shadec/cli.cpp
// Purpose: Argument parsing and the front end to toolchain pipeline.
//
//===----------------------------------------------------------------------===//

#include "tools/shadec/cli.hpp"

#include "codegen/common/Toolchain.hpp"
#include "codegen/x86_64/CodeGenerator.hpp"
#include "frontend/AstPrinter.hpp"
#include "frontend/Compiler.hpp"
#include "frontend/Lexer.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <string_view>

namespace shadec
{

namespace
{

using namespace shade;

CliParseResult usageError(std::string message)
{
    CliParseResult result{};
    result.action = CliAction::Error;
    result.error = std::move(message);
    return result;
}

/// @brief Print every token of @p source; returns false on a lexical error.
bool dumpTokens(const std::string &source,
                uint32_t fileId,
                const support::SourceManager &sm,
                std::ostream &out,
                std::ostream &err)
{
    frontend::Lexer lexer(source, fileId);
    for (;;)
    {
        frontend::Token tok = lexer.next();
        if (tok.kind == frontend::TokenKind::EndOfInput)
            break;
        out << tok.loc.line << ':' << tok.loc.column << ' '
            << frontend::tokenKindToString(tok.kind) << " '" << tok.text << "'\n";
    }
    if (const auto &error = lexer.error())
    {
        support::printDiag(*error, err, &sm);
        return false;
    }
    return true;
}

void note(const CliOptions &options, std::ostream &err, const std::string &message)
{
    if (options.verbose)
        support::printDiag(support::makeNote(message), err);
}

} // namespace

CliParseResult parseArgs(int argc, char **argv)
{
    CliParseResult result{};
    CliOptions &opts = result.options;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        auto takeValue = [&](std::string &dst) -> bool
        {
            if (i + 1 >= argc)
                return false;
            dst = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help")
        {
            result.action = CliAction::Help;
            return result;
        }
        else if (arg == "--version")
        {
            result.action = CliAction::Version;
            return result;
        }
        else if (arg == "-o" || arg == "--output")
        {
            if (!takeValue(opts.outputPath))
                return usageError(std::string(arg) + " requires an output path");
            opts.outputGiven = true;
        }
        else if (arg == "-S")
        {
            opts.assemblyOnly = true;
        }
        else if (arg == "--emit-asm")
        {
            std::string path;
            if (!takeValue(path))
                return usageError("--emit-asm requires a file path");
            opts.asmPath = std::move(path);
        }
        else if (arg == "--dump-tokens")
        {
            opts.dumpTokens = true;
        }
        else if (arg == "--dump-ast")
        {
            opts.dumpAst = true;
        }
        else if (arg == "--dump-typed-ast")
        {
            opts.dumpTypedAst = true;
        }
        else if (arg == "--assembler")
        {
            if (!takeValue(opts.assembler))
                return usageError("--assembler requires a program name or path");
        }
        else if (arg == "--linker")
        {
            if (!takeValue(opts.linker))
                return usageError("--linker requires a program name or path");
        }
        else if (arg == "--no-pipeline")
        {
            opts.pipelined = false;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            opts.verbose = true;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            return usageError("unknown option: " + std::string(arg));
        }
        else
        {
            if (!opts.sourcePath.empty())
                return usageError("multiple source files not supported");
            opts.sourcePath = std::string(arg);
        }
    }

    if (opts.sourcePath.empty())
        return usageError("no input file specified");
    return result;
}

int runCompiler(const CliOptions &options, std::ostream &out, std::ostream &err)
{
    auto loaded = tools::common::loadSourceFile(options.sourcePath);
    if (!loaded)
    {
        support::printDiag(loaded.error(), err);
        return 1;
    }
    const std::string &source = loaded.value();

    support::SourceManager sm;
    const uint32_t fileId = sm.addBuffer(options.sourcePath, source);

    if (options.dumpTokens)
    {
        if (!dumpTokens(source, fileId, sm, out, err))
            return 1;
        if (!options.dumpAst && !options.dumpTypedAst)
            return 0;
    }

    frontend::CompilerInput input{source, options.sourcePath, fileId};
    frontend::CompilerOptions compilerOptions{};
    compilerOptions.pipelined = options.pipelined;
    compilerOptions.verbose = options.verbose;
    compilerOptions.analyze = !options.dumpOnly() || options.dumpTypedAst;

    frontend::CompilerResult result = frontend::compile(input, compilerOptions, sm);
    result.diagnostics.printAll(err, &sm);
    if (result.diagnostics.errorCount() != 0 || !result.program)
        return 1;

    if (options.dumpOnly())
    {
        if (options.dumpAst)
            out << frontend::toSource(*result.program);
        if (options.dumpTypedAst)
        {
            frontend::AstPrinter printer;
            out << printer.dump(*result.program);
        }
        return 0;
    }
    if (!result.succeeded())
        return 1;

    codegen::x64::CodeGenerator generator;
    auto document = generator.generate(*result.program);
    if (!document)
    {
        support::printDiag(document.error(), err, &sm);
        return 1;
    }
    const std::string text = document.value().str();
    note(options, err, "generated " + std::to_string(document.value().program().size()) +
                           " program line(s)");

    if (options.assemblyOnly)
    {
        if (!options.outputGiven)
        {
            out << text;
            return 0;
        }
        auto written = codegen::common::writeAssembly(text, options.outputPath);
        if (!written)
        {
            support::printDiag(written.error(), err);
            return 1;
        }
        note(options, err, "wrote " + options.outputPath);
        return 0;
    }

    codegen::common::ToolchainOptions toolchain{};
    toolchain.assembler = options.assembler;
    toolchain.linker = options.linker;
    auto built = codegen::common::buildExecutable(text, options.outputPath, options.asmPath,
                                                  toolchain);
    if (!built)
    {
        support::printDiag(built.error(), err);
        return 1;
    }
    note(options, err, "wrote " + options.outputPath);
    return 0;
}

} // namespace shadec
