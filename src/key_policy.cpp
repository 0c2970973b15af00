//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/key_policy.cpp
// Purpose: Default key labelling rules and key rendering.
// Key invariants: Sequences, tuples and lazy collections are unlabelled by
//                 default even though the first two support positions.
// Ownership/Lifetime: The standard policy has static storage duration.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "arbor/key_policy.hpp"

#include <type_traits>
#include <utility>

namespace arbor
{

namespace
{
bool never(const ChildList &)
{
    return false;
}
} // namespace

KeyPolicy::KeyPolicy()
{
    kindRules_[CollectionKind::Sequence] = never;
    kindRules_[CollectionKind::Tuple] = never;
    kindRules_[CollectionKind::Lazy] = never;
}

bool KeyPolicy::shouldPrintKeys(const ChildList &children) const
{
    if (!children.supportsKeys())
        return false;
    if (!children.tag().empty())
    {
        auto it = tagRules_.find(children.tag());
        if (it != tagRules_.end())
            return it->second(children);
    }
    auto it = kindRules_.find(children.kind());
    if (it != kindRules_.end())
        return it->second(children);
    return true;
}

void KeyPolicy::renderChildKey(std::ostream &os, const ChildKey &key) const
{
    std::visit(
        [&os](const auto &k)
        {
            using K = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<K, std::monostate>)
            {
                os << "nothing";
            }
            else if constexpr (std::is_same_v<K, CartesianIndex>)
            {
                os << '(';
                for (std::size_t i = 0; i < k.coords.size(); ++i)
                {
                    if (i != 0)
                        os << ", ";
                    os << k.coords[i];
                }
                if (k.coords.size() == 1)
                    os << ',';
                os << ')';
            }
            else
            {
                os << k;
            }
        },
        key);
}

void KeyPolicy::setRule(CollectionKind kind, Rule rule)
{
    kindRules_[kind] = std::move(rule);
}

void KeyPolicy::setRule(const std::string &tag, Rule rule)
{
    tagRules_[tag] = std::move(rule);
}

void KeyPolicy::clearRules()
{
    kindRules_.clear();
    tagRules_.clear();
}

const KeyPolicy &KeyPolicy::standard()
{
    static const KeyPolicy policy;
    return policy;
}

} // namespace arbor
