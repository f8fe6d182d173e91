//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the helper used by the toolchain adapter to launch external
// processes.  The routine builds a shell command line from argv fragments,
// invokes `popen`, and collects the merged output for diagnostic reporting.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Subprocess launcher and PATH lookup for the shadec toolchain stage.

#include "common/RunProcess.hpp"

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace shade::common
{
namespace
{
std::string quote_posix_argument(const std::string &arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('"');

    for (const char ch : arg)
    {
        if (ch == '\\' || ch == '"' || ch == '$' || ch == '`')
        {
            quoted.push_back('\\');
        }
        quoted.push_back(ch);
    }

    quoted.push_back('"');
    return quoted;
}

bool is_executable_file(const std::string &path)
{
    struct stat info{};
    if (::stat(path.c_str(), &info) != 0)
        return false;
    return S_ISREG(info.st_mode) && ::access(path.c_str(), X_OK) == 0;
}
} // namespace

/// @brief Launch a subprocess using the host shell and capture its output.
/// @details Joins the provided @p argv fragments into a quoted command string,
///          spawns it via @c popen with stderr redirected into stdout, and
///          records the exit status.  The child inherits the current
///          environment unchanged.
RunResult run_process(const std::vector<std::string> &argv)
{
    std::string cmd;
    for (std::size_t i = 0; i < argv.size(); ++i)
    {
        if (i != 0)
        {
            cmd += ' ';
        }
        cmd += quote_posix_argument(argv[i]);
    }
    cmd += " 2>&1";

    RunResult rr{0, "", ""};
    FILE *pipe = popen(cmd.c_str(), "r");
    if (!pipe)
    {
        rr.exit_code = -1;
        rr.err = "failed to popen";
        return rr;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe))
    {
        rr.out += buffer;
    }

    const int status = pclose(pipe);
    if (status == -1)
        rr.exit_code = -1;
    else if (WIFEXITED(status))
        rr.exit_code = WEXITSTATUS(status);
    else
        rr.exit_code = status;
    // stderr is redirected to stdout, so the captured text lives in `out`.
    rr.err = rr.out;
    return rr;
}

std::optional<std::string> find_program(std::string_view program,
                                        std::optional<std::string> searchPath)
{
    if (program.empty())
        return std::nullopt;

    const std::string name(program);
    if (name.find('/') != std::string::npos)
    {
        if (is_executable_file(name))
            return name;
        return std::nullopt;
    }

    std::string path;
    if (searchPath.has_value())
    {
        path = std::move(*searchPath);
    }
    else if (const char *env = std::getenv("PATH"))
    {
        path = env;
    }

    std::size_t start = 0;
    while (start <= path.size())
    {
        std::size_t end = path.find(':', start);
        if (end == std::string::npos)
            end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty())
            dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate))
            return candidate;
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace shade::common
