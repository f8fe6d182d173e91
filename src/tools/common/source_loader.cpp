//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Standardise how command-line tools load source files into memory.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned string is owned by the caller.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace shade::tools::common
{

namespace
{

support::Diag ioError(std::string message)
{
    return support::makeError({}, std::move(message), "X1003", support::ErrorKind::Toolchain);
}

} // namespace

support::Expected<std::string> loadSourceFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ioError("unable to open " + path);

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(256ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
        return ioError("source file too large: " + path + " (limit: 256 MB)");

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        return support::Expected<std::string>(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return ioError("out of memory reading " + path);
    }
}

} // namespace shade::tools::common
