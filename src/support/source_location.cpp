//===----------------------------------------------------------------------===//
//
// Part of the Shade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc.  A location is valid when it
// refers to a file registered with the SourceManager; line and column are
// optional and exposed through hasLine() and hasColumn().
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace shade::support
{
/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager hands out identifiers starting at one, so the
///          default-constructed location (zero) marks synthesized values such
///          as toolchain diagnostics that have no position in user code.
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace shade::support
