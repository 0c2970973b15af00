//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: apps/argv_view.hpp
// Purpose: Lightweight non-owning view over argv-style argument arrays.
// Key invariants: Never modifies or owns the underlying argument storage.
// Ownership/Lifetime: Borrows pointers from the C runtime; callers must ensure
//                     validity through the view's lifetime.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace arbor::tools
{

/// @brief Lightweight non-owning view over argv-style argument arrays.
struct ArgvView
{
    int argc;
    char **argv;

    /// @brief Read the argument at @p index, returning an empty view on overflow.
    [[nodiscard]] std::string_view at(int index) const
    {
        if (index < 0 || index >= argc || argv == nullptr)
        {
            return std::string_view{};
        }
        return std::string_view(argv[index]);
    }

    /// @brief Produce a suffix view that skips the first @p count entries.
    [[nodiscard]] ArgvView drop_front(int count = 1) const
    {
        if (count >= argc)
        {
            return ArgvView{0, nullptr};
        }
        return ArgvView{argc - count, argv + count};
    }
};

} // namespace arbor::tools
