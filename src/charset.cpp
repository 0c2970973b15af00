//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/charset.cpp
// Purpose: Construct branch glyph sets and resolve the named presets.
// Key invariants: Preset names are matched case-sensitively.
// Ownership/Lifetime: CharacterSet is a plain value type.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "arbor/charset.hpp"

#include "arbor/util/unicode.hpp"

#include <stdexcept>
#include <utility>

namespace arbor
{

CharacterSet::CharacterSet(std::string mid,
                           std::string terminator,
                           std::string skip,
                           std::string dash,
                           std::string trunc,
                           std::string pair)
    : mid_(std::move(mid)), terminator_(std::move(terminator)), skip_(std::move(skip)),
      dash_(std::move(dash)), trunc_(std::move(trunc)), pair_(std::move(pair))
{
}

CharacterSet::CharacterSet(const CharacterSet &base, const Overrides &overrides)
    : CharacterSet(overrides.mid.value_or(base.mid_),
                   overrides.terminator.value_or(base.terminator_),
                   overrides.skip.value_or(base.skip_),
                   overrides.dash.value_or(base.dash_),
                   overrides.trunc.value_or(base.trunc_),
                   overrides.pair.value_or(base.pair_))
{
}

CharacterSet CharacterSet::unicode()
{
    return CharacterSet("├", "└", "│", "─", "⋮", " ⇒ ");
}

CharacterSet CharacterSet::ascii()
{
    return CharacterSet("+", "\\", "|", "--", "...", " => ");
}

/// @brief Map a preset name to its glyph set.
/// @details Used both by the throwing @ref preset and by the config loader,
///          which prefers to turn failures into diagnostics.
support::Result<CharacterSet> CharacterSet::lookup(std::string_view name)
{
    if (name == "unicode")
        return unicode();
    if (name == "ascii")
        return ascii();
    return support::Result<CharacterSet>::error("unrecognized character set preset: " +
                                                std::string(name));
}

CharacterSet CharacterSet::preset(std::string_view name)
{
    auto found = lookup(name);
    if (!found.isOk())
        throw std::invalid_argument(found.error());
    return std::move(found.value());
}

std::size_t CharacterSet::branchWidth() const
{
    return util::display_width(mid_) + util::display_width(dash_);
}

} // namespace arbor
