//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/arbor/value.hpp
// Purpose: Immutable dynamic value tree implementing TreeNode.
// Key invariants: Container elements are shared and never mutated after
//                 construction; dict entries keep insertion order.
// Ownership/Lifetime: Values share ownership of their elements, so copies are
//                     cheap and children outlive the ChildList that hands
//                     them out.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "arbor/tree_node.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace arbor
{

/// @brief Dynamically typed value usable as a printable tree.
/// @details Scalars are leaves.  Vectors, tuples, dicts, ranges and grids
///          expose their elements as children; ranges synthesize their
///          elements on each children() call.
class Value final : public TreeNode
{
  public:
    enum class Kind
    {
        Nothing,
        Bool,
        Int,
        Float,
        String,
        Vector,
        Tuple,
        Dict,
        Range,
        Grid
    };

    using Ptr = std::shared_ptr<const Value>;

    /// @brief The `nothing` value.
    Value();
    Value(bool b);
    Value(int i);
    Value(std::int64_t i);
    Value(double d);
    Value(const char *s);
    Value(std::string s);

    static Value vector(std::vector<Value> items);
    static Value vector(std::initializer_list<Value> items);
    static Value tuple(std::vector<Value> items);
    static Value tuple(std::initializer_list<Value> items);

    /// @brief Insertion-ordered dictionary.
    static Value dict(std::vector<std::pair<Value, Value>> entries);

    /// @brief Inclusive integer range `first:last`; empty when last < first.
    /// @throws std::length_error when the element count does not fit in size_t.
    static Value range(std::int64_t first, std::int64_t last);

    /// @brief Row-major 2-D grid.
    /// @throws std::invalid_argument when cells.size() != rows * cols.
    static Value grid(std::size_t rows, std::size_t cols, std::vector<Value> cells);

    Kind kind() const
    {
        return kind_;
    }

    /// @brief Element count for containers, 0 for scalars.
    std::size_t size() const;

    /// @brief Element @p i of a vector, tuple or grid (row-major).
    const Value &at(std::size_t i) const;

    bool asBool() const;
    std::int64_t asInt() const;
    double asFloat() const;
    const std::string &asString() const;

    void printValue(std::ostream &os, const DisplayContext &ctx) const override;

    bool hasChildren() const override;

    ChildList children() const override;

  private:
    struct RangeBounds
    {
        std::int64_t first;
        std::int64_t last;
    };

    struct GridShape
    {
        std::size_t rows;
        std::size_t cols;
    };

    using Scalar = std::variant<std::monostate, bool, std::int64_t, double, std::string, RangeBounds, GridShape>;

    Value(Kind kind, Scalar scalar, std::vector<Ptr> items, std::vector<Ptr> keys = {});

    static std::vector<Ptr> share(std::vector<Value> items);

    Kind kind_;
    Scalar scalar_;
    std::vector<Ptr> items_;
    std::vector<Ptr> keys_;
};

} // namespace arbor
