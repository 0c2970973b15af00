//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/value.cpp
// Purpose: Construction, compact text and child listing for Value trees.
// Key invariants: Compact text never contains a raw newline; strings are
//                 escaped and limited output elides with U+2026.
// Ownership/Lifetime: Elements are shared between copies of a Value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "arbor/value.hpp"

#include "arbor/util/unicode.hpp"

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace arbor
{

namespace
{
constexpr const char *kEllipsis = "…";

std::string formatFloat(double d, bool compact)
{
    char buf[64];
    std::string text;
    if (compact)
    {
        const int n = std::snprintf(buf, sizeof(buf), "%.6g", d);
        text.assign(buf, static_cast<std::size_t>(n));
    }
    else
    {
        auto res = std::to_chars(buf, buf + sizeof(buf), d);
        text.assign(buf, res.ptr);
    }
    if (text.find_first_of(".en") == std::string::npos)
        text += ".0";
    return text;
}

void writeEscaped(std::ostream &os, std::string_view s)
{
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            case '\r':
                os << "\\r";
                break;
            case '\t':
                os << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char hex[8];
                    std::snprintf(hex, sizeof(hex), "\\x%02x", static_cast<unsigned>(c));
                    os << hex;
                }
                else
                {
                    os << c;
                }
        }
    }
}

void writeString(std::ostream &os, const std::string &s, const DisplayContext &ctx)
{
    os << '"';
    if (ctx.limit && util::utf8_length(s) > ctx.maxStringChars)
    {
        writeEscaped(os, std::string_view(s).substr(0, util::utf8_prefix(s, ctx.maxStringChars)));
        os << kEllipsis;
    }
    else
    {
        writeEscaped(os, s);
    }
    os << '"';
}

/// @brief Write a delimited element list, eliding past maxItems when limited.
template <typename Fn>
void writeList(std::ostream &os, std::size_t count, const DisplayContext &ctx, Fn &&writeItem)
{
    const bool elide = ctx.limit && count > ctx.maxItems;
    const std::size_t shown = elide ? ctx.maxItems : count;
    for (std::size_t i = 0; i < shown; ++i)
    {
        if (i != 0)
            os << ", ";
        writeItem(i);
    }
    if (elide)
        os << (shown != 0 ? ", " : "") << kEllipsis;
}
} // namespace

Value::Value() : Value(Kind::Nothing, Scalar{}, {}) {}

Value::Value(bool b) : Value(Kind::Bool, Scalar(std::in_place_type<bool>, b), {}) {}

Value::Value(int i) : Value(static_cast<std::int64_t>(i)) {}

Value::Value(std::int64_t i) : Value(Kind::Int, Scalar(std::in_place_type<std::int64_t>, i), {}) {}

Value::Value(double d) : Value(Kind::Float, Scalar(std::in_place_type<double>, d), {}) {}

Value::Value(const char *s) : Value(std::string(s)) {}

Value::Value(std::string s)
    : Value(Kind::String, Scalar(std::in_place_type<std::string>, std::move(s)), {})
{
}

Value::Value(Kind kind, Scalar scalar, std::vector<Ptr> items, std::vector<Ptr> keys)
    : kind_(kind), scalar_(std::move(scalar)), items_(std::move(items)), keys_(std::move(keys))
{
}

std::vector<Value::Ptr> Value::share(std::vector<Value> items)
{
    std::vector<Ptr> out;
    out.reserve(items.size());
    for (auto &item : items)
        out.push_back(std::make_shared<const Value>(std::move(item)));
    return out;
}

Value Value::vector(std::vector<Value> items)
{
    return Value(Kind::Vector, Scalar{}, share(std::move(items)));
}

Value Value::vector(std::initializer_list<Value> items)
{
    return vector(std::vector<Value>(items));
}

Value Value::tuple(std::vector<Value> items)
{
    return Value(Kind::Tuple, Scalar{}, share(std::move(items)));
}

Value Value::tuple(std::initializer_list<Value> items)
{
    return tuple(std::vector<Value>(items));
}

Value Value::dict(std::vector<std::pair<Value, Value>> entries)
{
    std::vector<Value> keys;
    std::vector<Value> values;
    keys.reserve(entries.size());
    values.reserve(entries.size());
    for (auto &[k, v] : entries)
    {
        keys.push_back(std::move(k));
        values.push_back(std::move(v));
    }
    return Value(Kind::Dict, Scalar{}, share(std::move(values)), share(std::move(keys)));
}

Value Value::range(std::int64_t first, std::int64_t last)
{
    if (first <= last &&
        static_cast<std::uint64_t>(last) - static_cast<std::uint64_t>(first) >=
            std::numeric_limits<std::size_t>::max())
        throw std::length_error("range " + std::to_string(first) + ":" + std::to_string(last) +
                                " has more elements than size_t can count");
    return Value(Kind::Range, Scalar(std::in_place_type<RangeBounds>, RangeBounds{first, last}), {});
}

Value Value::grid(std::size_t rows, std::size_t cols, std::vector<Value> cells)
{
    if (cells.size() != rows * cols)
        throw std::invalid_argument("grid of " + std::to_string(rows) + "x" + std::to_string(cols) +
                                    " needs " + std::to_string(rows * cols) + " cells, got " +
                                    std::to_string(cells.size()));
    return Value(Kind::Grid, Scalar(std::in_place_type<GridShape>, GridShape{rows, cols}), share(std::move(cells)));
}

std::size_t Value::size() const
{
    if (kind_ == Kind::Range)
    {
        const auto &r = std::get<RangeBounds>(scalar_);
        if (r.last < r.first)
            return 0;
        return static_cast<std::size_t>(static_cast<std::uint64_t>(r.last) - static_cast<std::uint64_t>(r.first)) +
               1;
    }
    return items_.size();
}

const Value &Value::at(std::size_t i) const
{
    if (kind_ != Kind::Vector && kind_ != Kind::Tuple && kind_ != Kind::Grid && kind_ != Kind::Dict)
        throw std::logic_error("value has no indexed elements");
    return *items_.at(i);
}

bool Value::asBool() const
{
    return std::get<bool>(scalar_);
}

std::int64_t Value::asInt() const
{
    return std::get<std::int64_t>(scalar_);
}

double Value::asFloat() const
{
    return std::get<double>(scalar_);
}

const std::string &Value::asString() const
{
    return std::get<std::string>(scalar_);
}

void Value::printValue(std::ostream &os, const DisplayContext &ctx) const
{
    switch (kind_)
    {
        case Kind::Nothing:
            os << "nothing";
            break;
        case Kind::Bool:
            os << (asBool() ? "true" : "false");
            break;
        case Kind::Int:
            os << asInt();
            break;
        case Kind::Float:
            os << formatFloat(asFloat(), ctx.compact);
            break;
        case Kind::String:
            writeString(os, asString(), ctx);
            break;
        case Kind::Vector:
            os << '[';
            writeList(os, items_.size(), ctx, [&](std::size_t i) { items_[i]->printValue(os, ctx); });
            os << ']';
            break;
        case Kind::Tuple:
            os << '(';
            writeList(os, items_.size(), ctx, [&](std::size_t i) { items_[i]->printValue(os, ctx); });
            if (items_.size() == 1)
                os << ',';
            os << ')';
            break;
        case Kind::Dict:
            os << "Dict(";
            writeList(os,
                      items_.size(),
                      ctx,
                      [&](std::size_t i)
                      {
                          keys_[i]->printValue(os, ctx);
                          os << " => ";
                          items_[i]->printValue(os, ctx);
                      });
            os << ')';
            break;
        case Kind::Range:
        {
            const auto &r = std::get<RangeBounds>(scalar_);
            os << r.first << ':' << r.last;
            break;
        }
        case Kind::Grid:
        {
            const auto &g = std::get<GridShape>(scalar_);
            os << '[';
            for (std::size_t r = 0; r < g.rows; ++r)
            {
                if (r != 0)
                    os << "; ";
                for (std::size_t c = 0; c < g.cols; ++c)
                {
                    if (c != 0)
                        os << ' ';
                    items_[r * g.cols + c]->printValue(os, ctx);
                }
            }
            os << ']';
            break;
        }
    }
}

bool Value::hasChildren() const
{
    switch (kind_)
    {
        case Kind::Vector:
        case Kind::Tuple:
        case Kind::Dict:
        case Kind::Grid:
            return !items_.empty();
        case Kind::Range:
            return size() != 0;
        default:
            return false;
    }
}

ChildList Value::children() const
{
    switch (kind_)
    {
        case Kind::Vector:
        case Kind::Tuple:
        {
            ChildList list(kind_ == Kind::Vector ? CollectionKind::Sequence : CollectionKind::Tuple);
            for (const auto &item : items_)
                list.add(item);
            return list;
        }
        case Kind::Dict:
        {
            DisplayContext keyCtx;
            keyCtx.compact = true;
            keyCtx.limit = true;
            ChildList list(CollectionKind::Keyed);
            for (std::size_t i = 0; i < items_.size(); ++i)
            {
                std::ostringstream key;
                keys_[i]->printValue(key, keyCtx);
                list.add(key.str(), items_[i]);
            }
            return list;
        }
        case Kind::Range:
        {
            const auto &r = std::get<RangeBounds>(scalar_);
            ChildList list(CollectionKind::Sequence);
            // Count rather than compare so a range ending at INT64_MAX terminates.
            const std::size_t n = size();
            for (std::size_t i = 0; i < n; ++i)
                list.add(std::make_shared<const Value>(
                    static_cast<std::int64_t>(static_cast<std::uint64_t>(r.first) + i)));
            return list;
        }
        case Kind::Grid:
        {
            const auto &g = std::get<GridShape>(scalar_);
            ChildList list(CollectionKind::Keyed, "grid");
            for (std::size_t r = 0; r < g.rows; ++r)
            {
                for (std::size_t c = 0; c < g.cols; ++c)
                {
                    CartesianIndex idx{{static_cast<std::int64_t>(r), static_cast<std::int64_t>(c)}};
                    list.add(ChildKey(std::move(idx)), items_[r * g.cols + c]);
                }
            }
            return list;
        }
        default:
            return ChildList();
    }
}

} // namespace arbor
