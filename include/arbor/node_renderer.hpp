// include/arbor/node_renderer.hpp
// @brief Per-node text rendering hook used by the tree printer.
// @invariant Renderers write text only; they never emit branch glyphs.
// @ownership Renderers do not retain nodes or streams past a call.

#pragma once

#include "arbor/tree_node.hpp"

#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace arbor
{

/// @brief Converts one node's payload to display text.
class NodeRenderer
{
  public:
    virtual ~NodeRenderer() = default;

    /// @brief Write the text for @p node to @p os.
    /// @param ctx Formatting hints inherited from the caller.
    virtual void renderNode(std::ostream &os, const TreeNode &node, const DisplayContext &ctx) const = 0;
};

/// @brief Prints the node value in compact, size-limited form.
class DefaultRenderer final : public NodeRenderer
{
  public:
    void renderNode(std::ostream &os, const TreeNode &node, const DisplayContext &ctx) const override;
};

/// @brief Custom per-node rendering function.
using RenderFn = std::function<void(std::ostream &, const TreeNode &)>;

/// @brief Adapts a RenderFn to the NodeRenderer interface.
class FunctionRenderer final : public NodeRenderer
{
  public:
    explicit FunctionRenderer(RenderFn fn);

    void renderNode(std::ostream &os, const TreeNode &node, const DisplayContext &ctx) const override;

  private:
    RenderFn fn_;
};

/// @brief Shared default renderer instance.
const NodeRenderer &defaultRenderer();

/// @brief Capture the default rendering of @p node as a string.
/// @param context Inherited formatting hints; a default context when absent.
std::string renderNodeToString(const TreeNode &node,
                               const std::optional<DisplayContext> &context = std::nullopt);

/// @brief Capture the rendering of @p node by @p renderer as a string.
std::string renderNodeToString(const NodeRenderer &renderer,
                               const TreeNode &node,
                               const DisplayContext &context);

} // namespace arbor
