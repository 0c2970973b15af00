//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tree_node.cpp
// Purpose: ChildList construction helpers.
// Key invariants: Key support is fixed at construction from the kind.
// Ownership/Lifetime: ChildList shares ownership of its nodes.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "arbor/tree_node.hpp"

#include <utility>

namespace arbor
{

namespace
{
bool kindSupportsKeys(CollectionKind kind, bool declared)
{
    switch (kind)
    {
        case CollectionKind::Sequence:
        case CollectionKind::Tuple:
        case CollectionKind::Keyed:
            return true;
        case CollectionKind::Lazy:
            return false;
        case CollectionKind::Custom:
            return declared;
    }
    return declared;
}
} // namespace

ChildList::ChildList(CollectionKind kind, std::string tag, bool keyed)
    : kind_(kind), tag_(std::move(tag)), keyed_(kindSupportsKeys(kind, keyed))
{
}

/// @brief Positional collections record the 0-based index as the key.
void ChildList::add(NodePtr node)
{
    ChildKey key;
    if (keyed_)
        key = static_cast<std::int64_t>(entries_.size());
    entries_.push_back(ChildEntry{std::move(key), std::move(node)});
}

void ChildList::add(ChildKey key, NodePtr node)
{
    entries_.push_back(ChildEntry{std::move(key), std::move(node)});
}

} // namespace arbor
