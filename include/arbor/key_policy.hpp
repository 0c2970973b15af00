//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/arbor/key_policy.hpp
// Purpose: Decide whether child keys are printed and how a key is rendered.
// Key invariants: A collection without key support never prints keys.
// Ownership/Lifetime: Policies own their registered rules.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "arbor/tree_node.hpp"

#include <functional>
#include <map>
#include <ostream>
#include <string>

namespace arbor
{

/// @brief Key labelling decisions, overridable per collection kind.
/// @details The general rule prints keys for every collection that supports
///          key lookup.  Rules registered for a CollectionKind, or for a
///          custom tag, take precedence; a tag rule wins over a kind rule.
///          Subclasses may override either virtual outright.
class KeyPolicy
{
  public:
    using Rule = std::function<bool(const ChildList &)>;

    /// @brief Policy with the standard overrides installed.
    KeyPolicy();

    virtual ~KeyPolicy() = default;

    KeyPolicy(const KeyPolicy &) = default;
    KeyPolicy &operator=(const KeyPolicy &) = default;

    /// @brief Whether @p children should be labelled by default.
    virtual bool shouldPrintKeys(const ChildList &children) const;

    /// @brief Write the compact text of @p key.
    /// @details Coordinate keys render as a parenthesised tuple.
    virtual void renderChildKey(std::ostream &os, const ChildKey &key) const;

    /// @brief Register the decision for every collection of @p kind.
    void setRule(CollectionKind kind, Rule rule);

    /// @brief Register the decision for custom collections tagged @p tag.
    void setRule(const std::string &tag, Rule rule);

    /// @brief Remove every registered rule, leaving only the general rule.
    void clearRules();

    /// @brief Shared instance used when options name no policy.
    static const KeyPolicy &standard();

  private:
    std::map<CollectionKind, Rule> kindRules_;
    std::map<std::string, Rule> tagRules_;
};

} // namespace arbor
