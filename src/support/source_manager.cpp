//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager utility responsible for tracking source files
// referenced by diagnostics.  The manager assigns stable numeric identifiers to
// file paths, resolves those identifiers back to normalized strings, and keeps
// the text of registered buffers so diagnostics can quote the offending line.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace shade::support
{
namespace
{
std::string normalizePath(std::string path)
{
    if (!path.empty() && path.front() == '<')
        return path;
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
///
/// @details Paths are normalized so the same file reached through different
///          spellings maps to one identifier.  Pseudo names such as "<input>"
///          are kept verbatim.
///
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0) representing the stored path, 0 on overflow.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string{kSourceManagerFileIdOverflowMessage});
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(FileEntry{std::move(normalized), {}});
    path_to_id_.emplace(files_.back().path, file_id);
    return file_id;
}

/// @brief Register a path and remember its contents for caret rendering.
///
/// @details Re-registering a known path replaces the stored text; the
///          identifier stays the same.
uint32_t SourceManager::addBuffer(std::string path, std::string text)
{
    const uint32_t file_id = addFile(std::move(path));
    if (file_id != 0)
        files_[file_id - 1].text = std::move(text);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1].path;
}

std::string_view SourceManager::getLine(uint32_t file_id, uint32_t line) const
{
    if (file_id == 0 || file_id > files_.size() || line == 0)
        return {};

    std::string_view text = files_[file_id - 1].text;
    size_t start = 0;
    for (uint32_t current = 1; current < line; ++current)
    {
        const size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos)
            return {};
        start = nl + 1;
    }

    size_t end = text.find('\n', start);
    if (end == std::string_view::npos)
        end = text.size();
    if (end > start && text[end - 1] == '\r')
        --end;
    return text.substr(start, end - start);
}
} // namespace shade::support
