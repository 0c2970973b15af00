//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/util/unicode.cpp
// Purpose: UTF-8 decoding and display-width tables used for branch alignment.
// Key invariants: Decoding never fails; malformed bytes map to U+FFFD.
// Ownership/Lifetime: Stateless helpers.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "arbor/util/unicode.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>

namespace arbor::util
{

namespace
{
constexpr char32_t kReplacement = 0xFFFD;

struct Range
{
    char32_t lo;
    char32_t hi;
};

// Sorted, non-overlapping.
constexpr Range kZeroWidth[] = {
    {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x0610, 0x061A},
    {0x064B, 0x065F}, {0x0E31, 0x0E31}, {0x0E34, 0x0E3A}, {0x1AB0, 0x1AFF},
    {0x1DC0, 0x1DFF}, {0x200B, 0x200F}, {0x202A, 0x202E}, {0x2060, 0x2064},
    {0x20D0, 0x20FF}, {0xFE00, 0xFE0F}, {0xFE20, 0xFE2F}, {0xFEFF, 0xFEFF},
};

constexpr Range kWide[] = {
    {0x1100, 0x115F},   {0x231A, 0x231B},   {0x2329, 0x232A},   {0x2E80, 0x303E},
    {0x3041, 0x33FF},   {0x3400, 0x4DBF},   {0x4E00, 0x9FFF},   {0xA000, 0xA4CF},
    {0xAC00, 0xD7A3},   {0xF900, 0xFAFF},   {0xFE30, 0xFE4F},   {0xFF00, 0xFF60},
    {0xFFE0, 0xFFE6},   {0x1F300, 0x1F64F}, {0x1F900, 0x1F9FF}, {0x20000, 0x2FFFD},
    {0x30000, 0x3FFFD},
};

template <std::size_t N> bool inTable(const Range (&table)[N], char32_t cp)
{
    auto it = std::upper_bound(std::begin(table),
                               std::end(table),
                               cp,
                               [](char32_t value, const Range &r) { return value < r.lo; });
    if (it == std::begin(table))
        return false;
    --it;
    return cp <= it->hi;
}

/// @brief Decode one sequence starting at @p i; advances @p i past it.
char32_t decodeOne(std::string_view text, std::size_t &i)
{
    const auto b0 = static_cast<unsigned char>(text[i]);
    if (b0 < 0x80)
    {
        ++i;
        return b0;
    }

    std::size_t len = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((b0 & 0xE0) == 0xC0)
    {
        len = 2;
        cp = b0 & 0x1F;
        min = 0x80;
    }
    else if ((b0 & 0xF0) == 0xE0)
    {
        len = 3;
        cp = b0 & 0x0F;
        min = 0x800;
    }
    else if ((b0 & 0xF8) == 0xF0)
    {
        len = 4;
        cp = b0 & 0x07;
        min = 0x10000;
    }
    else
    {
        ++i;
        return kReplacement;
    }

    if (i + len > text.size())
    {
        ++i;
        return kReplacement;
    }
    for (std::size_t k = 1; k < len; ++k)
    {
        const auto b = static_cast<unsigned char>(text[i + k]);
        if ((b & 0xC0) != 0x80)
        {
            ++i;
            return kReplacement;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
        ++i;
        return kReplacement;
    }
    i += len;
    return cp;
}
} // namespace

std::u32string decode_utf8(std::string_view text)
{
    std::u32string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
        out.push_back(decodeOne(text, i));
    return out;
}

int char_width(char32_t cp)
{
    if (cp == 0)
        return 0;
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0))
        return 0;
    if (inTable(kZeroWidth, cp))
        return 0;
    if (inTable(kWide, cp))
        return 2;
    return 1;
}

std::size_t display_width(std::string_view text)
{
    std::size_t width = 0;
    std::size_t i = 0;
    while (i < text.size())
        width += static_cast<std::size_t>(char_width(decodeOne(text, i)));
    return width;
}

std::size_t utf8_prefix(std::string_view text, std::size_t count)
{
    std::size_t i = 0;
    for (std::size_t n = 0; n < count && i < text.size(); ++n)
        decodeOne(text, i);
    return i;
}

std::size_t utf8_length(std::string_view text)
{
    std::size_t n = 0;
    std::size_t i = 0;
    while (i < text.size())
    {
        decodeOne(text, i);
        ++n;
    }
    return n;
}

} // namespace arbor::util
