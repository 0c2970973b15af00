// include/arbor/print_options.hpp
// @brief Options record passed unchanged through one print call.
// @invariant maxDepth is non-negative when handed to the printer.
// @ownership Value type; keyPolicy is borrowed and must outlive the call.

#pragma once

#include "arbor/charset.hpp"
#include "arbor/tree_node.hpp"

namespace arbor
{

class KeyPolicy;

/// @brief Tri-state key labelling mode.
enum class KeyMode
{
    Auto,   ///< Ask the key policy per node.
    Always, ///< Label every collection that supports keys.
    Never   ///< Never label.
};

/// @brief Configuration for one printTree/treeToString call.
struct PrintOptions
{
    /// Deepest level whose children are still expanded.
    int maxDepth = 5;

    /// Emit the trunc marker beneath subtrees cut by maxDepth.
    bool indicateTruncation = true;

    /// Branch glyphs.
    CharacterSet charset = CharacterSet::unicode();

    /// Key labelling mode.
    KeyMode printKeys = KeyMode::Auto;

    /// Policy consulted in KeyMode::Auto; the standard policy when null.
    const KeyPolicy *keyPolicy = nullptr;

    /// Hints forwarded to the node renderer.
    DisplayContext context{};
};

} // namespace arbor
