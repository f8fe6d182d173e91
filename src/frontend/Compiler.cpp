//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Compiler.cpp
// Purpose: Wires the lexer (threaded or on demand), parser and analyzer.
//
// A lexer that stops on a bad character ends the token stream early, which
// the parser then reports as an unexpected end of input.  That parse error is
// noise: the driver discards it and reports the lexical error instead.
//
//===----------------------------------------------------------------------===//

#include "frontend/Compiler.hpp"
#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"
#include "frontend/SemanticAnalyzer.hpp"
#include "frontend/TokenPipe.hpp"
#include "frontend/TokenStream.hpp"
#include "support/diag_expected.hpp"

#include <string>

namespace shade::frontend
{

namespace
{

struct ParseOutcome
{
    support::Expected<Program> program;
    std::optional<support::Diag> lexError;
};

ParseOutcome parseWithPipe(std::string_view source,
                           uint32_t fileId,
                           support::DiagnosticEngine &diag)
{
    TokenPipe pipe(std::string(source), fileId);
    TokenStream stream(pipe);
    Parser parser(stream, diag);
    auto program = parser.parseProgram();
    // Draining to EndOfInput before reading the error slot keeps the producer
    // from blocking on a full slot.
    auto lexError = pipe.lexicalError();
    return ParseOutcome{std::move(program), std::move(lexError)};
}

ParseOutcome parseOnDemand(std::string_view source,
                           uint32_t fileId,
                           support::DiagnosticEngine &diag)
{
    Lexer lexer(std::string(source), fileId);
    TokenStream stream(lexer);
    Parser parser(stream, diag);
    auto program = parser.parseProgram();
    return ParseOutcome{std::move(program), lexer.error()};
}

size_t countStatements(const Block &block)
{
    size_t n = 0;
    for (const auto &stmt : block.statements)
    {
        ++n;
        std::visit(Overload{[](const Assignment &) {},
                            [&](const Condition &c)
                            { n += countStatements(c.thenBlock) + countStatements(c.elseBlock); },
                            [&](const Loop &l) { n += countStatements(l.body); },
                            [&](const Block &b) { n += countStatements(b); }},
                   stmt.node);
    }
    return n;
}

} // namespace

bool CompilerResult::succeeded() const
{
    return program.has_value() && analyzed && diagnostics.errorCount() == 0;
}

CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       support::SourceManager &sm)
{
    CompilerResult result{};

    if (input.fileId.has_value())
        result.fileId = *input.fileId;
    else
        result.fileId = sm.addBuffer(std::string(input.path), std::string(input.source));

    if (result.fileId == 0)
    {
        result.diagnostics.report(
            support::makeError({},
                               std::string{support::kSourceManagerFileIdOverflowMessage},
                               "I1000",
                               support::ErrorKind::Internal));
        return result;
    }

    if (options.verbose)
        result.diagnostics.report(support::makeNote(
            std::string("parsing ") + std::string(input.path) +
            (options.pipelined ? " with a pipelined lexer" : " with an on-demand lexer")));

    // Phase 1: Lexing and parsing
    ParseOutcome outcome = options.pipelined
                               ? parseWithPipe(input.source, result.fileId, result.diagnostics)
                               : parseOnDemand(input.source, result.fileId, result.diagnostics);

    if (outcome.lexError)
    {
        result.diagnostics.discard(support::ErrorKind::Parse);
        result.diagnostics.report(std::move(*outcome.lexError));
        return result;
    }
    if (!outcome.program)
        return result;

    result.program = std::move(outcome.program.value());
    if (options.verbose)
        result.diagnostics.report(support::makeNote(
            "parsed " + std::to_string(countStatements(result.program->root)) +
            " statement(s) in " + std::to_string(result.program->tables.size()) + " scope(s)"));

    if (!options.analyze)
        return result;

    // Phase 2: Semantic analysis
    SemanticAnalyzer analyzer(result.diagnostics);
    auto analyzed = analyzer.analyze(*result.program);
    result.analyzed = analyzed.hasValue();

    if (options.verbose)
        result.diagnostics.report(support::makeNote(
            "semantic analysis finished with " + std::to_string(analyzer.errorCount()) +
            " error(s)"));
    return result;
}

} // namespace shade::frontend
