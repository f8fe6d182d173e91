//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/common/LabelUtil.hpp
// Purpose: Small helpers for generating assembler-safe labels.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace shade::codegen::common
{

// Sanitize an arbitrary name into an assembler-safe label.
// - Permits [A-Za-z0-9_.]
// - Replaces other characters with '_'
// - Ensures label does not start with a digit by prefixing 'L' if needed
inline std::string sanitizeLabel(std::string_view in)
{
    std::string out;
    out.reserve(in.size() + 1);
    for (unsigned char ch : in)
    {
        const bool isAlpha = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
        const bool isDigit = (ch >= '0' && ch <= '9');
        if (isAlpha || isDigit || ch == '_' || ch == '.')
            out.push_back(static_cast<char>(ch));
        else
            out.push_back('_');
    }
    if (out.empty() || (out[0] >= '0' && out[0] <= '9'))
        out.insert(out.begin(), 'L');
    return out;
}

/// @brief Hands out program-wide increasing label suffixes.
class LabelAllocator
{
  public:
    /// @brief Reserve the next suffix; labels sharing it belong to one construct.
    uint32_t reserve()
    {
        return next_++;
    }

    /// @brief Compose "<prefix>_<id>".
    static std::string make(std::string_view prefix, uint32_t id)
    {
        std::string out = sanitizeLabel(prefix);
        out.push_back('_');
        out += std::to_string(id);
        return out;
    }

  private:
    uint32_t next_ = 0;
};

} // namespace shade::codegen::common
