//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the tree printer and its entry points.
//
// The printer performs a depth-first pre-order walk.  Each node's rendered
// text is written first; continuation lines of multi-line text are indented
// with the frame's prefix.  Children are then drawn one per branch:
//
//   root
//   ├─ first
//   │  └─ grandchild
//   └─ last
//
// The prefix handed to a child extends the parent's prefix with the skip
// glyph (for non-last children) or blank padding (for the last child), and,
// when keys are printed, with padding as wide as the key label.  All widths are
// measured in display columns.
//
// Nodes at maxDepth that still have children are not expanded; a trunc marker
// line and a blank prefix line stand in for their subtree.
//
// Example Output (ASCII set, keys on):
//   Dict("a" => 1, "b" => [2, 3])
//   +-- "a" => 1
//   \-- "b" => [2, 3]
//              +-- 2
//              \-- 3
//
//===----------------------------------------------------------------------===//
#pragma once

#include "arbor/key_policy.hpp"
#include "arbor/node_renderer.hpp"
#include "arbor/print_options.hpp"
#include "arbor/tree_node.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace arbor
{

/// @brief Raised when the output stream enters a failed state mid-print.
class OutputError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Per-frame traversal state.
struct RenderState
{
    /// Recursion depth; 0 at the root.
    int depth = 0;

    /// Text written before continuation lines and child branches.
    std::string prefix;
};

/// @brief Recursive branch-drawing walk over a TreeNode.
/// @details Keeps its own copy of the options.  The renderer and any
///          options.keyPolicy are borrowed and must outlive the printer.
class TreePrinter
{
  public:
    /// @throws std::invalid_argument when options.maxDepth is negative.
    TreePrinter(const NodeRenderer &renderer, PrintOptions options);

    /// @brief Print @p node and its subtree starting from @p state.
    /// @throws OutputError when @p os fails.
    void print(std::ostream &os, const TreeNode &node, const RenderState &state = {}) const;

  private:
    /// @brief Resolve the key labelling decision for one child collection.
    bool printKeysFor(const ChildList &children) const;

    void writeText(std::ostream &os, const std::string &text, const std::string &prefix) const;

    const NodeRenderer &renderer_;
    PrintOptions options_;
    const KeyPolicy &keys_;
};

/// @brief Print @p root to @p os using the default renderer.
void printTree(std::ostream &os, const TreeNode &root, const PrintOptions &options = PrintOptions{});

/// @brief Print @p root to @p os with a custom renderer.
void printTree(const NodeRenderer &renderer,
               std::ostream &os,
               const TreeNode &root,
               const PrintOptions &options = PrintOptions{});

/// @brief Print @p root to @p os with a custom rendering function.
void printTree(const RenderFn &render,
               std::ostream &os,
               const TreeNode &root,
               const PrintOptions &options = PrintOptions{});

/// @brief Print @p root; the stream defaults to standard output at the call site.
void printTree(const TreeNode &root,
               const PrintOptions &options = PrintOptions{},
               std::ostream &os = std::cout);

/// @brief Render @p root into a string using the default renderer.
std::string treeToString(const TreeNode &root, const PrintOptions &options = PrintOptions{});

/// @brief Render @p root into a string with a custom renderer.
std::string treeToString(const NodeRenderer &renderer,
                         const TreeNode &root,
                         const PrintOptions &options = PrintOptions{});

} // namespace arbor
