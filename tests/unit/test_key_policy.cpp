// File: tests/unit/test_key_policy.cpp
// Purpose: Verify default key labelling decisions and key rendering.
// Key invariants: Collections without key support never print keys.

#include <gtest/gtest.h>

#include "arbor/key_policy.hpp"

#include <sstream>

using namespace arbor;

namespace
{
std::string renderKey(const KeyPolicy &policy, const ChildKey &key)
{
    std::ostringstream os;
    policy.renderChildKey(os, key);
    return os.str();
}
} // namespace

TEST(KeyPolicy, DefaultsByKind)
{
    const KeyPolicy &policy = KeyPolicy::standard();
    EXPECT_FALSE(policy.shouldPrintKeys(ChildList(CollectionKind::Sequence)));
    EXPECT_FALSE(policy.shouldPrintKeys(ChildList(CollectionKind::Tuple)));
    EXPECT_FALSE(policy.shouldPrintKeys(ChildList(CollectionKind::Lazy)));
    EXPECT_TRUE(policy.shouldPrintKeys(ChildList(CollectionKind::Keyed)));
    EXPECT_TRUE(policy.shouldPrintKeys(ChildList(CollectionKind::Custom, "table", true)));
    EXPECT_FALSE(policy.shouldPrintKeys(ChildList(CollectionKind::Custom, "stream", false)));
}

TEST(KeyPolicy, RulesOverrideDefaults)
{
    KeyPolicy policy;
    policy.setRule(CollectionKind::Sequence, [](const ChildList &) { return true; });
    policy.setRule(CollectionKind::Keyed, [](const ChildList &c) { return c.size() > 1; });
    EXPECT_TRUE(policy.shouldPrintKeys(ChildList(CollectionKind::Sequence)));

    ChildList keyed(CollectionKind::Keyed);
    EXPECT_FALSE(policy.shouldPrintKeys(keyed));

    // A tag rule takes precedence over the kind rule.
    policy.setRule("grid", [](const ChildList &) { return true; });
    EXPECT_TRUE(policy.shouldPrintKeys(ChildList(CollectionKind::Keyed, "grid")));

    policy.clearRules();
    EXPECT_TRUE(policy.shouldPrintKeys(ChildList(CollectionKind::Tuple)));
    EXPECT_FALSE(policy.shouldPrintKeys(ChildList(CollectionKind::Lazy)));
}

TEST(KeyPolicy, SubclassOverride)
{
    struct NeverKeys final : KeyPolicy
    {
        bool shouldPrintKeys(const ChildList &) const override
        {
            return false;
        }
    };
    NeverKeys policy;
    EXPECT_FALSE(policy.shouldPrintKeys(ChildList(CollectionKind::Keyed)));
}

TEST(KeyPolicy, RendersKeys)
{
    const KeyPolicy &policy = KeyPolicy::standard();
    EXPECT_EQ(renderKey(policy, ChildKey(std::int64_t{3})), "3");
    EXPECT_EQ(renderKey(policy, ChildKey(std::string("\"a\""))), "\"a\"");
    EXPECT_EQ(renderKey(policy, ChildKey(CartesianIndex{{1, 2}})), "(1, 2)");
    EXPECT_EQ(renderKey(policy, ChildKey(CartesianIndex{{7}})), "(7,)");
    EXPECT_EQ(renderKey(policy, ChildKey{}), "nothing");
}

TEST(ChildList, PositionalKeysFollowInsertionOrder)
{
    ChildList list(CollectionKind::Sequence);
    list.add(nullptr);
    list.add(nullptr);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(std::get<std::int64_t>(list[0].key), 0);
    EXPECT_EQ(std::get<std::int64_t>(list[1].key), 1);

    ChildList lazy(CollectionKind::Lazy);
    lazy.add(nullptr);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(lazy[0].key));
    EXPECT_FALSE(lazy.supportsKeys());
}
