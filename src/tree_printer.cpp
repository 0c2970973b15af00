//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the recursive tree printer and the thin entry points wrapping
// it.  The walk is a single forward pass over each node's materialized
// ChildList; the index doubles as the lookahead that selects the terminator
// glyph for the last child.  Nothing outlives a frame except what has already
// been written to the stream.
//
//===----------------------------------------------------------------------===//

#include "arbor/tree_printer.hpp"

#include "arbor/util/unicode.hpp"

#include <sstream>
#include <string_view>
#include <utility>

/// @file
/// @brief Houses the branch-drawing walk and its stream/string drivers.
/// @details Width bookkeeping goes through @ref arbor::util::display_width so
///          wide glyphs in the character set, node text or key labels keep the
///          columns under each branch aligned.

namespace arbor
{

namespace
{
void checkStream(const std::ostream &os)
{
    if (!os)
        throw OutputError("tree output stream is in a failed state");
}

void validate(const PrintOptions &options)
{
    if (options.maxDepth < 0)
        throw std::invalid_argument("maxDepth must be non-negative, got " +
                                    std::to_string(options.maxDepth));
}
} // namespace

TreePrinter::TreePrinter(const NodeRenderer &renderer, PrintOptions options)
    : renderer_(renderer), options_(std::move(options)),
      keys_(options_.keyPolicy ? *options_.keyPolicy : KeyPolicy::standard())
{
    validate(options_);
}

/// @brief Write @p text one line at a time.
/// @details The first line lands wherever the caller left the cursor (after
///          the branch glyph, or at column 0 for the root); every later line is
///          preceded by @p prefix so it stays under the branch.
void TreePrinter::writeText(std::ostream &os, const std::string &text, const std::string &prefix) const
{
    std::string_view rest(text);
    bool first = true;
    for (;;)
    {
        const auto nl = rest.find('\n');
        if (!first)
            os << prefix;
        os << rest.substr(0, nl) << '\n';
        first = false;
        if (nl == std::string_view::npos)
            break;
        rest.remove_prefix(nl + 1);
    }
    checkStream(os);
}

bool TreePrinter::printKeysFor(const ChildList &children) const
{
    if (!children.supportsKeys())
        return false;
    switch (options_.printKeys)
    {
        case KeyMode::Always:
            return true;
        case KeyMode::Never:
            return false;
        case KeyMode::Auto:
            break;
    }
    return keys_.shouldPrintKeys(children);
}

/// @brief Print one node and recurse into its children.
/// @details Children past maxDepth are replaced by the trunc marker without
///          being materialized.  The
///          child prefix for a non-last branch carries the skip glyph so the
///          vertical line continues to the next sibling; the last branch pads
///          with spaces of the same width.
void TreePrinter::print(std::ostream &os, const TreeNode &node, const RenderState &state) const
{
    writeText(os, renderNodeToString(renderer_, node, options_.context), state.prefix);

    if (!node.hasChildren())
        return;

    const CharacterSet &cs = options_.charset;
    if (state.depth >= options_.maxDepth)
    {
        if (options_.indicateTruncation)
        {
            os << state.prefix << cs.trunc() << '\n';
            os << state.prefix << '\n';
            checkStream(os);
        }
        return;
    }

    const ChildList children = node.children();
    if (children.empty())
        return;

    const bool withKeys = printKeysFor(children);
    const std::size_t dashWidth = util::display_width(cs.dash());

    for (std::size_t i = 0; i < children.size(); ++i)
    {
        const ChildEntry &child = children[i];
        if (!child.node)
            throw std::logic_error("child list contains a null node");

        RenderState next{state.depth + 1, state.prefix};
        os << state.prefix;

        if (i + 1 == children.size())
        {
            os << cs.terminator();
            next.prefix.append(util::display_width(cs.skip()) + dashWidth + 1, ' ');
        }
        else
        {
            os << cs.mid();
            next.prefix += cs.skip();
            next.prefix.append(dashWidth + 1, ' ');
        }

        os << cs.dash() << ' ';

        if (withKeys)
        {
            std::ostringstream buf;
            keys_.renderChildKey(buf, child.key);
            const std::string key = buf.str();
            os << key << cs.pair();
            next.prefix.append(util::display_width(key) + util::display_width(cs.pair()), ' ');
        }
        checkStream(os);

        print(os, *child.node, next);
    }
}

void printTree(std::ostream &os, const TreeNode &root, const PrintOptions &options)
{
    printTree(defaultRenderer(), os, root, options);
}

void printTree(const NodeRenderer &renderer, std::ostream &os, const TreeNode &root, const PrintOptions &options)
{
    TreePrinter printer(renderer, options);
    printer.print(os, root);
}

void printTree(const RenderFn &render, std::ostream &os, const TreeNode &root, const PrintOptions &options)
{
    const FunctionRenderer renderer(render);
    printTree(renderer, os, root, options);
}

void printTree(const TreeNode &root, const PrintOptions &options, std::ostream &os)
{
    printTree(os, root, options);
}

std::string treeToString(const TreeNode &root, const PrintOptions &options)
{
    return treeToString(defaultRenderer(), root, options);
}

std::string treeToString(const NodeRenderer &renderer, const TreeNode &root, const PrintOptions &options)
{
    std::ostringstream buf;
    printTree(renderer, buf, root, options);
    return buf.str();
}

} // namespace arbor
