// File: tests/unit/test_charset.cpp
// Purpose: Verify preset glyphs, derivation with overrides and preset lookup.
// Key invariants: Unknown preset names are rejected before any printing.

#include <gtest/gtest.h>

#include "arbor/charset.hpp"

#include <stdexcept>

using arbor::CharacterSet;

TEST(CharacterSet, UnicodePreset)
{
    const CharacterSet cs = CharacterSet::unicode();
    EXPECT_EQ(cs.mid(), "├");
    EXPECT_EQ(cs.terminator(), "└");
    EXPECT_EQ(cs.skip(), "│");
    EXPECT_EQ(cs.dash(), "─");
    EXPECT_EQ(cs.trunc(), "⋮");
    EXPECT_EQ(cs.pair(), " ⇒ ");
    EXPECT_EQ(cs.branchWidth(), 2u);
}

TEST(CharacterSet, AsciiPreset)
{
    const CharacterSet cs = CharacterSet::ascii();
    EXPECT_EQ(cs.mid(), "+");
    EXPECT_EQ(cs.terminator(), "\\");
    EXPECT_EQ(cs.skip(), "|");
    EXPECT_EQ(cs.dash(), "--");
    EXPECT_EQ(cs.trunc(), "...");
    EXPECT_EQ(cs.pair(), " => ");
    EXPECT_EQ(cs.branchWidth(), 3u);
}

TEST(CharacterSet, OverridesKeepUnspecifiedFields)
{
    CharacterSet::Overrides ov;
    ov.trunc = "~";
    ov.pair = ": ";
    const CharacterSet cs(CharacterSet::ascii(), ov);
    EXPECT_EQ(cs.trunc(), "~");
    EXPECT_EQ(cs.pair(), ": ");
    EXPECT_EQ(cs.mid(), "+");
    EXPECT_EQ(cs.dash(), "--");
    EXPECT_EQ(CharacterSet(CharacterSet::unicode(), {}), CharacterSet::unicode());
}

TEST(CharacterSet, BranchWidthUsesDisplayColumns)
{
    const CharacterSet cs("╞", "╘", "│", "中", ":", "=");
    EXPECT_EQ(cs.branchWidth(), 3u);
}

TEST(CharacterSet, PresetLookupByName)
{
    EXPECT_EQ(CharacterSet::preset("unicode"), CharacterSet::unicode());
    EXPECT_EQ(CharacterSet::preset("ascii"), CharacterSet::ascii());

    auto missing = CharacterSet::lookup("ASCII");
    ASSERT_FALSE(missing.isOk());
    EXPECT_EQ(missing.error(), "unrecognized character set preset: ASCII");

    EXPECT_THROW(CharacterSet::preset("fancy"), std::invalid_argument);
}
