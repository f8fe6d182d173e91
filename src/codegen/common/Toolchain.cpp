//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/common/Toolchain.cpp
// Purpose: Assembler/linker invocation and temporary file management.
//
//===----------------------------------------------------------------------===//

#include "codegen/common/Toolchain.hpp"

#include "common/RunProcess.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace shade::codegen::common
{

namespace
{

support::Diag toolchainError(std::string message, const char *code)
{
    return support::makeError({}, std::move(message), code, support::ErrorKind::Toolchain);
}

void removeQuietly(const std::string &path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

/// @brief Create an empty temporary file named shade-XXXXXX<suffix>.
std::optional<std::string> makeTempFile(const std::string &suffix)
{
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec)
        dir = "/tmp";
    std::string pattern = (dir / "shade-XXXXXX").string() + suffix;
    const int fd = mkstemps(pattern.data(), static_cast<int>(suffix.size()));
    if (fd < 0)
        return std::nullopt;
    close(fd);
    return pattern;
}

/// @brief Removes a file on scope exit unless released.
class FileGuard
{
  public:
    explicit FileGuard(std::string path) : path_(std::move(path)) {}

    FileGuard(const FileGuard &) = delete;
    FileGuard &operator=(const FileGuard &) = delete;

    ~FileGuard()
    {
        if (!path_.empty())
            removeQuietly(path_);
    }

    void release()
    {
        path_.clear();
    }

  private:
    std::string path_;
};

bool isNasm(const std::string &assembler)
{
    return std::filesystem::path(assembler).filename() == "nasm";
}

std::string describeFailure(const std::string &tool, const shade::common::RunResult &rr)
{
    std::string message;
    if (rr.exit_code == -1)
        message = "failed to launch '" + tool + "'";
    else
        message = "'" + tool + "' exited with status " + std::to_string(rr.exit_code);
    if (!rr.out.empty())
    {
        message += ":\n";
        message += rr.out;
        while (!message.empty() && message.back() == '\n')
            message.pop_back();
    }
    return message;
}

} // namespace

support::Expected<void> writeAssembly(std::string_view text, const std::string &path)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return toolchainError("unable to open '" + path + "' for writing", "X1003");
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.close();
    if (!out)
        return toolchainError("failed writing assembly to '" + path + "'", "X1003");
    return {};
}

support::Expected<std::string> locateTool(const std::string &tool,
                                          const ToolchainOptions &options)
{
    auto found = shade::common::find_program(tool, options.searchPath);
    if (!found)
        return toolchainError("'" + tool + "' not found", "X1000");
    return *found;
}

std::vector<std::string> assemblerCommand(const std::string &assembler,
                                          const std::string &asmPath,
                                          const std::string &objPath)
{
    if (isNasm(assembler))
        return {assembler, "-w+orphan-labels", "-g", "-F", "dwarf", "-f", "elf64", asmPath, "-o",
                objPath};
    return {assembler, "-Worphan-labels", "-g", "dwarf2", "-f", "elf64", asmPath, "-o", objPath};
}

std::vector<std::string> linkerCommand(const std::string &linker,
                                       const ToolchainOptions &options,
                                       const std::string &objPath,
                                       const std::string &exePath)
{
    std::vector<std::string> cmd = {linker};
    if (!options.dynamicLinker.empty())
    {
        cmd.push_back("-dynamic-linker");
        cmd.push_back(options.dynamicLinker);
    }
    cmd.push_back("-o");
    cmd.push_back(exePath);
    cmd.push_back(objPath);
    for (const auto &lib : options.libraries)
        cmd.push_back("-l" + lib);
    return cmd;
}

support::Expected<void> buildExecutable(std::string_view asmText,
                                        const std::string &exePath,
                                        const std::optional<std::string> &asmPath,
                                        const ToolchainOptions &options)
{
    // Resolve both tools before touching the filesystem.
    auto assembler = locateTool(options.assembler, options);
    if (!assembler)
        return assembler.error();
    auto linker = locateTool(options.linker, options);
    if (!linker)
        return linker.error();

    std::string sourcePath;
    std::optional<FileGuard> sourceGuard;
    if (asmPath)
    {
        sourcePath = *asmPath;
    }
    else
    {
        auto temp = makeTempFile(".s");
        if (!temp)
            return toolchainError("unable to create a temporary assembly file", "X1003");
        sourcePath = *temp;
        sourceGuard.emplace(sourcePath);
    }
    if (auto written = writeAssembly(asmText, sourcePath); !written)
        return written.error();

    std::string objPath;
    std::optional<FileGuard> objGuard;
    if (options.keepObject)
    {
        objPath = exePath + ".o";
    }
    else
    {
        auto temp = makeTempFile(".o");
        if (!temp)
            return toolchainError("unable to create a temporary object file", "X1003");
        objPath = *temp;
        objGuard.emplace(objPath);
    }

    const auto asmRun =
        shade::common::run_process(assemblerCommand(assembler.value(), sourcePath, objPath));
    if (asmRun.exit_code != 0)
    {
        if (options.keepObject)
            removeQuietly(objPath);
        return toolchainError(describeFailure(options.assembler, asmRun), "X1001");
    }

    const auto linkRun =
        shade::common::run_process(linkerCommand(linker.value(), options, objPath, exePath));
    if (linkRun.exit_code != 0)
    {
        removeQuietly(exePath);
        return toolchainError(describeFailure(options.linker, linkRun), "X1002");
    }
    return {};
}

} // namespace shade::codegen::common
