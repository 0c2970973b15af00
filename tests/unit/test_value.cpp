// File: tests/unit/test_value.cpp
// Purpose: Verify Value compact text, limits and the child collections it
//          exposes to the printer.
// Key invariants: Compact text is single-line; dict order is insertion order.

#include <gtest/gtest.h>

#include "arbor/node_renderer.hpp"
#include "arbor/value.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace arbor;

namespace
{
std::string text(const Value &v, DisplayContext ctx = {})
{
    std::ostringstream os;
    v.printValue(os, ctx);
    return os.str();
}
} // namespace

TEST(Value, ScalarText)
{
    EXPECT_EQ(text(Value()), "nothing");
    EXPECT_EQ(text(Value(true)), "true");
    EXPECT_EQ(text(Value(-12)), "-12");
    EXPECT_EQ(text(Value(2.5)), "2.5");
    EXPECT_EQ(text(Value(1.0)), "1.0");
    EXPECT_EQ(text(Value("a\"b\n")), "\"a\\\"b\\n\"");
}

TEST(Value, FloatPrecisionFollowsCompactFlag)
{
    DisplayContext compact;
    compact.compact = true;
    EXPECT_EQ(text(Value(3.14159265358979), compact), "3.14159");
    EXPECT_EQ(text(Value(3.14159265358979)), "3.14159265358979");
}

TEST(Value, ContainerText)
{
    EXPECT_EQ(text(Value::vector({1, "x", Value::vector({})})), "[1, \"x\", []]");
    EXPECT_EQ(text(Value::tuple({1})), "(1,)");
    EXPECT_EQ(text(Value::tuple({1, 2})), "(1, 2)");
    EXPECT_EQ(text(Value::dict({{"a", 1}, {2, "b"}})), "Dict(\"a\" => 1, 2 => \"b\")");
    EXPECT_EQ(text(Value::range(1, 3)), "1:3");
    EXPECT_EQ(text(Value::grid(2, 3, {1, 2, 3, 4, 5, 6})), "[1 2 3; 4 5 6]");
}

TEST(Value, LimitElidesLongValues)
{
    DisplayContext ctx;
    ctx.limit = true;
    ctx.maxItems = 2;
    ctx.maxStringChars = 3;
    EXPECT_EQ(text(Value::vector({1, 2, 3, 4}), ctx), "[1, 2, …]");
    EXPECT_EQ(text(Value::vector({1, 2}), ctx), "[1, 2]");
    EXPECT_EQ(text(Value("中文字符"), ctx), "\"中文字…\"");

    ctx.limit = false;
    EXPECT_EQ(text(Value::vector({1, 2, 3, 4}), ctx), "[1, 2, 3, 4]");
}

TEST(Value, ChildrenByKind)
{
    const ChildList seq = Value::vector({1, 2}).children();
    EXPECT_EQ(seq.kind(), CollectionKind::Sequence);
    EXPECT_EQ(seq.size(), 2u);

    EXPECT_EQ(Value::tuple({1}).children().kind(), CollectionKind::Tuple);

    const ChildList dict = Value::dict({{"b", 1}, {"a", 2}}).children();
    EXPECT_EQ(dict.kind(), CollectionKind::Keyed);
    ASSERT_EQ(dict.size(), 2u);
    EXPECT_EQ(std::get<std::string>(dict[0].key), "\"b\"");
    EXPECT_EQ(std::get<std::string>(dict[1].key), "\"a\"");

    const ChildList grid = Value::grid(1, 2, {7, 8}).children();
    EXPECT_EQ(grid.tag(), "grid");
    EXPECT_EQ(std::get<CartesianIndex>(grid[1].key), (CartesianIndex{{0, 1}}));

    EXPECT_TRUE(Value("abc").children().empty());
    EXPECT_TRUE(Value(1).children().empty());
}

TEST(Value, RangeSynthesizesChildren)
{
    const Value r = Value::range(4, 6);
    EXPECT_EQ(r.size(), 3u);
    const ChildList c = r.children();
    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(renderNodeToString(*c[2].node), "6");
    EXPECT_TRUE(Value::range(3, 1).children().empty());
}

TEST(Value, RangeBoundsAtInt64Limits)
{
    constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

    const Value top = Value::range(kMax - 1, kMax);
    EXPECT_EQ(top.size(), 2u);
    const ChildList c = top.children();
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(renderNodeToString(*c[1].node), "9223372036854775807");

    const Value bottom = Value::range(kMin, kMin + 1);
    EXPECT_EQ(bottom.size(), 2u);
    EXPECT_EQ(renderNodeToString(*bottom.children()[0].node), "-9223372036854775808");

    EXPECT_EQ(Value::range(kMin, -1).size(), static_cast<std::size_t>(kMax) + 1);
    EXPECT_EQ(Value::range(kMax, kMin).size(), 0u);
    EXPECT_THROW(Value::range(kMin, kMax), std::length_error);
}

TEST(Value, HasChildrenWithoutListing)
{
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    EXPECT_TRUE(Value::range(0, kMax).hasChildren());
    EXPECT_FALSE(Value::range(1, 0).hasChildren());
    EXPECT_TRUE(Value::vector({1}).hasChildren());
    EXPECT_FALSE(Value::vector(std::vector<Value>{}).hasChildren());
    EXPECT_TRUE(Value::grid(1, 1, {7}).hasChildren());
    EXPECT_FALSE(Value("leaf").hasChildren());
    EXPECT_FALSE(Value().hasChildren());
}

TEST(Value, GridShapeIsChecked)
{
    EXPECT_THROW(Value::grid(2, 2, {1, 2, 3}), std::invalid_argument);
}

TEST(Value, Accessors)
{
    const Value v = Value::vector({Value(5), Value("s")});
    EXPECT_EQ(v.size(), 2u);
    EXPECT_EQ(v.at(0).asInt(), 5);
    EXPECT_EQ(v.at(1).asString(), "s");
    EXPECT_THROW(v.at(2), std::out_of_range);
    EXPECT_THROW(Value(1).at(0), std::logic_error);
}
