// File: tests/unit/test_config.cpp
// Purpose: Verify configuration loader parses tree and charset settings.
// Key invariants: Invalid values keep defaults and produce warnings; an
//                 unknown preset fails the load.
// Ownership/Lifetime: Test owns configuration data only.

#include <gtest/gtest.h>

#include "arbor/config/config.hpp"

#include <sstream>

using namespace arbor;
using arbor::config::Config;
using arbor::config::loadFromFile;
using arbor::config::loadFromString;

TEST(Config, LoadsSampleFile)
{
    Config cfg;
    support::DiagnosticEngine diags;
    ASSERT_TRUE(loadFromFile(ARBOR_CONFIG_INI, cfg, diags));
    EXPECT_EQ(diags.warningCount(), 0u);

    EXPECT_EQ(cfg.options.maxDepth, 3);
    EXPECT_FALSE(cfg.options.indicateTruncation);
    EXPECT_EQ(cfg.options.printKeys, KeyMode::Always);
    EXPECT_EQ(cfg.options.charset.mid(), "+");
    EXPECT_EQ(cfg.options.charset.dash(), "--");
    EXPECT_EQ(cfg.options.charset.pair(), " -> ");
    EXPECT_EQ(cfg.options.charset.trunc(), "~");
}

TEST(Config, InvalidValuesKeepDefaults)
{
    Config cfg;
    support::DiagnosticEngine diags;
    ASSERT_TRUE(loadFromFile(ARBOR_CONFIG_BAD_INI, cfg, diags));
    EXPECT_EQ(diags.errorCount(), 0u);
    EXPECT_EQ(diags.warningCount(), 3u);

    EXPECT_EQ(cfg.options.maxDepth, 5);
    EXPECT_TRUE(cfg.options.indicateTruncation);
    EXPECT_EQ(cfg.options.printKeys, KeyMode::Auto);
    EXPECT_EQ(cfg.options.charset.mid(), "*");
    EXPECT_EQ(cfg.options.charset.terminator(), "└");
}

TEST(Config, UnknownPresetFailsLoad)
{
    Config cfg;
    support::DiagnosticEngine diags;
    EXPECT_FALSE(loadFromFile(ARBOR_CONFIG_UNKNOWN_PRESET_INI, cfg, diags));
    ASSERT_EQ(diags.errorCount(), 1u);
    const auto &d = diags.diagnostics().front();
    EXPECT_EQ(d.message, "unrecognized character set preset: runes");
    EXPECT_NE(d.origin.find(":2"), std::string::npos);
}

TEST(Config, MissingFileIsError)
{
    Config cfg;
    support::DiagnosticEngine diags;
    EXPECT_FALSE(loadFromFile("/nonexistent/arbor.ini", cfg, diags));
    EXPECT_EQ(diags.errorCount(), 1u);
}

TEST(Config, CharsetOverridesApplyAfterPresetRegardlessOfOrder)
{
    Config cfg;
    support::DiagnosticEngine diags;
    ASSERT_TRUE(loadFromString("[charset]\nskip = !\n[tree]\ncharset = ascii\n", cfg, diags));
    EXPECT_EQ(cfg.options.charset.skip(), "!");
    EXPECT_EQ(cfg.options.charset.mid(), "+");
}

TEST(Config, StrayKeysAndSectionsWarn)
{
    Config cfg;
    support::DiagnosticEngine diags;
    ASSERT_TRUE(loadFromString("orphan = 1\n[layout]\nwidth = 3\n[tree\n", cfg, diags, "inline"));
    EXPECT_EQ(diags.warningCount(), 3u);
    EXPECT_EQ(diags.diagnostics().front().origin, "inline:1");
}

TEST(Config, ParseHelpers)
{
    bool b = false;
    EXPECT_TRUE(config::parseBool("Yes", b));
    EXPECT_TRUE(b);
    EXPECT_TRUE(config::parseBool("0", b));
    EXPECT_FALSE(b);
    EXPECT_FALSE(config::parseBool("maybe", b));

    KeyMode mode = KeyMode::Auto;
    EXPECT_TRUE(config::parseKeyMode("never", mode));
    EXPECT_EQ(mode, KeyMode::Never);
    EXPECT_TRUE(config::parseKeyMode("TRUE", mode));
    EXPECT_EQ(mode, KeyMode::Always);
    EXPECT_FALSE(config::parseKeyMode("sometimes", mode));
}

TEST(Diagnostics, FormatsWithAndWithoutOrigin)
{
    support::DiagnosticEngine diags;
    diags.report(support::makeWarning("a.ini:3", "odd value"));
    diags.report(support::makeError({}, "broken"));
    diags.report(support::Diagnostic{support::Severity::Note, "fyi", {}});
    EXPECT_EQ(diags.errorCount(), 1u);
    EXPECT_EQ(diags.warningCount(), 1u);

    std::ostringstream os;
    diags.printAll(os);
    EXPECT_EQ(os.str(), "a.ini:3: warning: odd value\nerror: broken\nnote: fyi\n");
}
