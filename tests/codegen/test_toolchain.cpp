// File: tests/codegen/test_toolchain.cpp
// Purpose: Cover tool lookup, command construction, and an end-to-end build of
//          a generated program with the system assembler and linker.
// Key invariants: A missing tool is reported before any file is written; a
//                 failed link leaves no executable behind.
// Ownership/Lifetime: The test owns its temporary directory and removes it.
// Links: src/codegen/common/Toolchain.cpp, src/common/RunProcess.cpp

#include <gtest/gtest.h>

#include "codegen/common/Toolchain.hpp"
#include "codegen/x86_64/CodeGenerator.hpp"
#include "common/RunProcess.hpp"
#include "frontend/Compiler.hpp"
#include "support/source_manager.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

using namespace shade;
using codegen::common::ToolchainOptions;

namespace
{

namespace fs = std::filesystem;

struct TempDirectoryGuard
{
    TempDirectoryGuard()
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = fs::temp_directory_path() /
               ("shade_toolchain_" + std::string(info->name()) + "_" + std::to_string(::getpid()));
        std::error_code ec;
        fs::remove_all(path, ec);
        fs::create_directories(path);
    }

    ~TempDirectoryGuard()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string &name) const
    {
        return (path / name).string();
    }

    fs::path path;
};

bool toolchainAvailable(const ToolchainOptions &options)
{
    return shade::common::find_program(options.assembler).has_value() &&
           shade::common::find_program(options.linker).has_value() &&
           fs::exists(options.dynamicLinker);
}

std::string generateAssembly(const std::string &src)
{
    support::SourceManager sm;
    auto r = frontend::compile(frontend::CompilerInput{src, "e2e.shd"}, {}, sm);
    EXPECT_TRUE(r.succeeded());
    if (!r.succeeded())
        return {};
    codegen::x64::CodeGenerator gen;
    auto doc = gen.generate(*r.program);
    EXPECT_TRUE(doc.hasValue());
    return doc.hasValue() ? doc.value().str() : std::string{};
}

} // namespace

TEST(Toolchain, AssemblerCommandLines)
{
    EXPECT_EQ(codegen::common::assemblerCommand("/usr/bin/yasm", "p.s", "p.o"),
              (std::vector<std::string>{
                  "/usr/bin/yasm", "-Worphan-labels", "-g", "dwarf2", "-f", "elf64", "p.s", "-o",
                  "p.o"}));
    EXPECT_EQ(codegen::common::assemblerCommand("/opt/bin/nasm", "p.s", "p.o"),
              (std::vector<std::string>{"/opt/bin/nasm",
                                        "-w+orphan-labels",
                                        "-g",
                                        "-F",
                                        "dwarf",
                                        "-f",
                                        "elf64",
                                        "p.s",
                                        "-o",
                                        "p.o"}));
}

TEST(Toolchain, LinkerCommandLine)
{
    ToolchainOptions options{};
    EXPECT_EQ(codegen::common::linkerCommand("ld", options, "p.o", "p"),
              (std::vector<std::string>{
                  "ld", "-dynamic-linker", "/lib64/ld-linux-x86-64.so.2", "-o", "p", "p.o",
                  "-lc"}));

    options.dynamicLinker.clear();
    options.libraries = {"c", "m"};
    EXPECT_EQ(codegen::common::linkerCommand("ld", options, "p.o", "p"),
              (std::vector<std::string>{"ld", "-o", "p", "p.o", "-lc", "-lm"}));
}

TEST(Toolchain, MissingAssemblerIsReportedFirst)
{
    TempDirectoryGuard dir;
    ToolchainOptions options{};
    options.searchPath = dir.path.string();

    const std::string exe = dir.file("prog");
    const std::string asmFile = dir.file("prog.s");
    auto built = codegen::common::buildExecutable("bits 64\n", exe, asmFile, options);
    ASSERT_FALSE(built.hasValue());
    EXPECT_EQ(built.error().code, "X1000");
    EXPECT_EQ(built.error().message, "'yasm' not found");
    EXPECT_EQ(built.error().kind, support::ErrorKind::Toolchain);
    EXPECT_FALSE(fs::exists(exe));
    EXPECT_FALSE(fs::exists(asmFile));
}

TEST(Toolchain, LocateToolHonoursSearchPath)
{
    TempDirectoryGuard dir;
    const std::string tool = dir.file("fake-as");
    std::ofstream(tool) << "#!/bin/sh\nexit 0\n";
    fs::permissions(tool, fs::perms::owner_all);

    ToolchainOptions options{};
    options.searchPath = "/nonexistent:" + dir.path.string();
    auto found = codegen::common::locateTool("fake-as", options);
    ASSERT_TRUE(found.hasValue());
    EXPECT_EQ(found.value(), tool);

    auto missing = codegen::common::locateTool("fake-ld", options);
    ASSERT_FALSE(missing.hasValue());
    EXPECT_EQ(missing.error().code, "X1000");
}

TEST(Toolchain, WriteAssemblyReportsUnwritablePath)
{
    TempDirectoryGuard dir;
    auto bad = codegen::common::writeAssembly("x", dir.file("missing/dir/out.s"));
    ASSERT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().code, "X1003");

    const std::string good = dir.file("out.s");
    ASSERT_TRUE(codegen::common::writeAssembly("bits 64\n", good).hasValue());
    std::ifstream in(good);
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_EQ(text.str(), "bits 64\n");
}

TEST(Toolchain, RunProcessCapturesOutputAndStatus)
{
    auto rr = shade::common::run_process({"sh", "-c", "echo hello; exit 3"});
    EXPECT_EQ(rr.exit_code, 3);
    EXPECT_EQ(rr.out, "hello\n");
}

TEST(Toolchain, AssemblerFailureIsReported)
{
    ToolchainOptions options{};
    if (!toolchainAvailable(options))
        GTEST_SKIP() << "yasm or ld not available";

    TempDirectoryGuard dir;
    const std::string exe = dir.file("broken");
    auto built = codegen::common::buildExecutable(
        "section .text\n    frobnicate rax\n", exe, std::nullopt, options);
    ASSERT_FALSE(built.hasValue());
    EXPECT_EQ(built.error().code, "X1001");
    EXPECT_EQ(built.error().message.rfind("'yasm' exited with status", 0), 0u);
    EXPECT_FALSE(fs::exists(exe));
}

TEST(Toolchain, LinkFailureRemovesExecutable)
{
    ToolchainOptions options{};
    if (!toolchainAvailable(options))
        GTEST_SKIP() << "yasm or ld not available";

    TempDirectoryGuard dir;
    const std::string exe = dir.file("unlinked");
    // The entry point references a symbol nothing defines.
    auto built = codegen::common::buildExecutable(
        "bits 64\nextern shade_missing_symbol\nglobal _start\nsection .text\n_start:\n"
        "    call shade_missing_symbol\n",
        exe,
        std::nullopt,
        options);
    ASSERT_FALSE(built.hasValue());
    EXPECT_EQ(built.error().code, "X1002");
    EXPECT_FALSE(fs::exists(exe));
}

TEST(Toolchain, EndToEndProgramRunsAndExitsCleanly)
{
    ToolchainOptions options{};
    if (!toolchainAvailable(options))
        GTEST_SKIP() << "yasm or ld not available";

    const std::string text = generateAssembly(R"(
total = 0
for i = 1; i <= 10; i = i + 1 {
    total = total + i
}
a, b = "left", "right"
a, b = b, a
f = 1.5 * 4.0
if (total == 55) && ((a == "right") && (f >= 6.0)) {
    shadow total = "done"
} else {
    total = 0 - 1
}
)");
    ASSERT_FALSE(text.empty());

    TempDirectoryGuard dir;
    const std::string exe = dir.file("prog");
    const std::string asmFile = dir.file("prog.s");
    options.keepObject = true;
    auto built = codegen::common::buildExecutable(text, exe, asmFile, options);
    ASSERT_TRUE(built.hasValue()) << built.error().message;
    EXPECT_TRUE(fs::exists(exe));
    EXPECT_TRUE(fs::exists(exe + ".o"));
    EXPECT_TRUE(fs::exists(asmFile));

    auto rr = shade::common::run_process({exe});
    EXPECT_EQ(rr.exit_code, 0) << rr.out;
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
