//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version.cpp
// Purpose: Provide the version query reported by `arbor-tree --version`.
// Key invariants: Matches the version recorded in CMakeLists.txt.
// Ownership/Lifetime: Returns a pointer to a string with static storage
//                     duration; callers must not attempt to free it.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "arbor/version.hpp"

namespace arbor
{
/// @brief Report the semantic version string of the library.
/// @return Pointer to a string containing the "major.minor.patch" version.
const char *arbor_version() noexcept
{
    return "0.1.0";
}
} // namespace arbor
