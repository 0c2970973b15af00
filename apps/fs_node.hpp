// apps/fs_node.hpp
// @brief TreeNode adapter over a filesystem hierarchy.
// @invariant Entries are listed sorted by name; symlinks are never followed.
// @ownership Each node owns its path; children are allocated per listing.

#pragma once

#include "arbor/tree_node.hpp"

#include <filesystem>

namespace arbor::tools
{

/// @brief A file or directory presented as a tree node.
/// @details Directory children form a Custom collection tagged "directory"
///          without key support.  Listing errors surface as
///          std::filesystem::filesystem_error from children().
class FsNode final : public TreeNode
{
  public:
    /// @param path Entry to present.
    /// @param showFullPath Print the whole path rather than the file name.
    explicit FsNode(std::filesystem::path path, bool showFullPath = false);

    void printValue(std::ostream &os, const DisplayContext &ctx) const override;

    bool hasChildren() const override;

    ChildList children() const override;

    const std::filesystem::path &path() const
    {
        return path_;
    }

  private:
    std::filesystem::path path_;
    bool showFullPath_;
};

} // namespace arbor::tools
