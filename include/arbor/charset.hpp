// include/arbor/charset.hpp
// @brief Glyph bundle used to draw tree branches.
// @invariant Immutable once constructed; derived sets copy their base.
// @ownership Value type; owns its six strings.

#pragma once

#include "arbor/support/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace arbor
{

/// @brief Set of strings used to pretty-print tree branches.
class CharacterSet
{
  public:
    /// @brief Subset of fields replaced when deriving from a base set.
    struct Overrides
    {
        std::optional<std::string> mid;
        std::optional<std::string> terminator;
        std::optional<std::string> skip;
        std::optional<std::string> dash;
        std::optional<std::string> trunc;
        std::optional<std::string> pair;
    };

    /// @brief Build a set from six explicit glyph strings.
    /// @param mid Branch segment for non-last children.
    /// @param terminator Branch segment for the last child.
    /// @param skip Vertical continuation under an open branch.
    /// @param dash Horizontal filler after mid/terminator.
    /// @param trunc Marker drawn beneath truncated subtrees.
    /// @param pair Separator between a child's key and its value.
    CharacterSet(std::string mid,
                 std::string terminator,
                 std::string skip,
                 std::string dash,
                 std::string trunc,
                 std::string pair);

    /// @brief Copy @p base, replacing only the fields set in @p overrides.
    CharacterSet(const CharacterSet &base, const Overrides &overrides);

    /// @brief Box-drawing preset: `├ └ │ ─ ⋮ ⇒`.
    static CharacterSet unicode();

    /// @brief Plain ASCII preset: `+ \ | -- ... =>`.
    static CharacterSet ascii();

    /// @brief Resolve a preset by case-sensitive name ("unicode" or "ascii").
    static support::Result<CharacterSet> lookup(std::string_view name);

    /// @brief Resolve a preset by name.
    /// @throws std::invalid_argument when @p name is not a known preset.
    static CharacterSet preset(std::string_view name);

    const std::string &mid() const
    {
        return mid_;
    }

    const std::string &terminator() const
    {
        return terminator_;
    }

    const std::string &skip() const
    {
        return skip_;
    }

    const std::string &dash() const
    {
        return dash_;
    }

    const std::string &trunc() const
    {
        return trunc_;
    }

    const std::string &pair() const
    {
        return pair_;
    }

    /// @brief Display-column width of mid followed by dash.
    std::size_t branchWidth() const;

    bool operator==(const CharacterSet &other) const = default;

  private:
    std::string mid_;
    std::string terminator_;
    std::string skip_;
    std::string dash_;
    std::string trunc_;
    std::string pair_;
};

} // namespace arbor
