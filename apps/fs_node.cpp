// apps/fs_node.cpp
// @brief Filesystem TreeNode adapter implementation.
// @invariant Directories print with a trailing '/', symlinks as "name -> target".
// @ownership Paths are copied into child nodes.

#include "fs_node.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace arbor::tools
{

FsNode::FsNode(fs::path path, bool showFullPath) : path_(std::move(path)), showFullPath_(showFullPath) {}

void FsNode::printValue(std::ostream &os, const DisplayContext &) const
{
    const fs::file_status st = fs::symlink_status(path_);
    std::string name = showFullPath_ || !path_.has_filename() ? path_.string() : path_.filename().string();
    os << name;
    if (fs::is_symlink(st))
    {
        std::error_code ec;
        const fs::path target = fs::read_symlink(path_, ec);
        if (!ec)
            os << " -> " << target.string();
    }
    else if (fs::is_directory(st) && (name.empty() || name.back() != '/'))
    {
        os << '/';
    }
}

bool FsNode::hasChildren() const
{
    if (!fs::is_directory(fs::symlink_status(path_)))
        return false;
    return fs::directory_iterator(path_) != fs::directory_iterator();
}

ChildList FsNode::children() const
{
    ChildList list(CollectionKind::Custom, "directory", false);
    if (!fs::is_directory(fs::symlink_status(path_)))
        return list;

    std::vector<fs::path> entries;
    for (const auto &entry : fs::directory_iterator(path_))
        entries.push_back(entry.path());
    std::sort(entries.begin(),
              entries.end(),
              [](const fs::path &a, const fs::path &b) { return a.filename() < b.filename(); });

    for (auto &p : entries)
        list.add(std::make_shared<const FsNode>(std::move(p)));
    return list;
}

} // namespace arbor::tools
