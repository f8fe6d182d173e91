//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the manager mapping file identifiers to paths and source text.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings and registered buffers.
// Links: support/source_location.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace shade::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Maintains the mapping between numeric file identifiers, their normalized
/// filesystem paths and, when registered through addBuffer(), the source text
/// used to render caret lines under diagnostics.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Register @p path together with its contents.
    /// @param path File system path (or a pseudo name such as "<input>").
    /// @param text Complete source text; copied into the manager.
    /// @return File identifier, 0 on overflow.
    uint32_t addBuffer(std::string path, std::string text);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path string view; empty when unknown.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Retrieve the text of 1-based @p line of @p file_id.
    /// @return Line without its terminator; empty when no buffer was registered.
    std::string_view getLine(uint32_t file_id, uint32_t line) const;

  private:
    struct FileEntry
    {
        std::string path;
        std::string text;
    };

    /// Index corresponds to file identifier - 1; deque keeps references stable.
    std::deque<FileEntry> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace shade::support
