//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the capability interface a host tree must implement to
// be printed, together with the child collection it hands back.
//
// A host exposes two things per node:
// - its payload text, written through printValue() under a DisplayContext
// - its children, materialized into a ChildList in their natural order
//
// The ChildList records what kind of collection the children came from so
// that the key policy can decide whether labels are meaningful.  Positional
// collections (sequences, tuples) carry their indices as keys, keyed
// collections carry host-supplied key text or coordinate tuples, lazy
// collections carry no keys at all.
//
// Children are held through shared pointers: hosts that already own their
// nodes can hand out shared ownership, and hosts that synthesize children on
// demand (ranges, directory listings) can allocate them per call.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace arbor
{

/// @brief Formatting hints inherited by node renderers.
struct DisplayContext
{
    /// Prefer the short single-line form of a value.
    bool compact = false;

    /// Allow long values to elide their tail.
    bool limit = false;

    /// Output target understands ANSI colour sequences.
    bool color = false;

    /// Elements shown before a limited collection elides the rest.
    std::size_t maxItems = 10;

    /// Code points shown before a limited string is cut.
    std::size_t maxStringChars = 60;
};

/// @brief Ordered tuple of integer coordinates used as a child key.
struct CartesianIndex
{
    std::vector<std::int64_t> coords;

    bool operator==(const CartesianIndex &other) const = default;
};

/// @brief Label attached to a child: none, position, host text or coordinates.
using ChildKey = std::variant<std::monostate, std::int64_t, std::string, CartesianIndex>;

/// @brief Shape of the collection a ChildList was built from.
enum class CollectionKind
{
    Sequence, ///< Ordered positional collection (vector-like).
    Tuple,    ///< Fixed-size positional grouping.
    Keyed,    ///< Map-like collection with explicit keys.
    Lazy,     ///< Generated collection without key lookup.
    Custom    ///< Host-defined kind identified by a tag.
};

class TreeNode;

/// @brief Shared handle to an immutable node.
using NodePtr = std::shared_ptr<const TreeNode>;

/// @brief One child and the key it is reachable under.
struct ChildEntry
{
    ChildKey key;
    NodePtr node;
};

/// @brief Materialized child collection of a node.
/// @invariant Entries keep insertion order; no sorting is ever applied.
class ChildList
{
  public:
    using const_iterator = std::vector<ChildEntry>::const_iterator;

    /// @brief Empty positional collection.
    ChildList() = default;

    /// @brief Empty collection of the given kind.
    /// @param kind Collection shape.
    /// @param tag Host-defined name, meaningful for CollectionKind::Custom.
    /// @param keyed Key support for Custom collections; other kinds derive it.
    explicit ChildList(CollectionKind kind, std::string tag = {}, bool keyed = false);

    /// @brief Append a child keyed by its position (or unkeyed for Lazy).
    void add(NodePtr node);

    /// @brief Append a child under an explicit key.
    void add(ChildKey key, NodePtr node);

    CollectionKind kind() const
    {
        return kind_;
    }

    const std::string &tag() const
    {
        return tag_;
    }

    /// @brief Whether the collection supports key lookup at all.
    bool supportsKeys() const
    {
        return keyed_;
    }

    std::size_t size() const
    {
        return entries_.size();
    }

    bool empty() const
    {
        return entries_.empty();
    }

    const ChildEntry &operator[](std::size_t i) const
    {
        return entries_[i];
    }

    const_iterator begin() const
    {
        return entries_.begin();
    }

    const_iterator end() const
    {
        return entries_.end();
    }

  private:
    CollectionKind kind_ = CollectionKind::Sequence;
    std::string tag_;
    bool keyed_ = true;
    std::vector<ChildEntry> entries_;
};

/// @brief Capability interface implemented by printable host trees.
class TreeNode
{
  public:
    virtual ~TreeNode() = default;

    /// @brief Write the node payload's own text.
    virtual void printValue(std::ostream &os, const DisplayContext &ctx) const = 0;

    /// @brief Children in natural order; empty for leaves.
    virtual ChildList children() const = 0;

    /// @brief Whether children() would be non-empty.
    /// @details Asked before the depth check so a truncated node never has its
    ///          children materialized.  Override when the answer is cheaper
    ///          than building the list.
    virtual bool hasChildren() const
    {
        return !children().empty();
    }
};

} // namespace arbor
