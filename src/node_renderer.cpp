//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/node_renderer.cpp
// Purpose: Default node renderer and the string-capturing helpers.
// Key invariants: The default renderer always forces compact and limited
//                 output on top of the inherited context.
// Ownership/Lifetime: Renderers are stateless apart from a stored callable.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "arbor/node_renderer.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace arbor
{

void DefaultRenderer::renderNode(std::ostream &os, const TreeNode &node, const DisplayContext &ctx) const
{
    DisplayContext local = ctx;
    local.compact = true;
    local.limit = true;
    node.printValue(os, local);
}

FunctionRenderer::FunctionRenderer(RenderFn fn) : fn_(std::move(fn))
{
    if (!fn_)
        throw std::invalid_argument("node render function is empty");
}

void FunctionRenderer::renderNode(std::ostream &os, const TreeNode &node, const DisplayContext &) const
{
    fn_(os, node);
}

const NodeRenderer &defaultRenderer()
{
    static const DefaultRenderer renderer{};
    return renderer;
}

std::string renderNodeToString(const TreeNode &node, const std::optional<DisplayContext> &context)
{
    return renderNodeToString(defaultRenderer(), node, context.value_or(DisplayContext{}));
}

std::string renderNodeToString(const NodeRenderer &renderer,
                               const TreeNode &node,
                               const DisplayContext &context)
{
    std::ostringstream buf;
    renderer.renderNode(buf, node, context);
    return buf.str();
}

} // namespace arbor
