// include/arbor/config/config.hpp
// @brief INI-like configuration loader for print options.
// @invariant Invalid values leave defaults untouched and produce a warning.
// @ownership Loader reads the file and retains nothing.

#pragma once

#include "arbor/print_options.hpp"
#include "arbor/support/diagnostics.hpp"

#include <string>
#include <string_view>

namespace arbor::config
{

/// @brief Settings read from a configuration file.
struct Config
{
    PrintOptions options{};
};

/// @brief Load configuration text from @p path into @p cfg.
/// @return False when the file cannot be read or contains an error.
bool loadFromFile(const std::string &path, Config &cfg, support::DiagnosticEngine &diags);

/// @brief Parse configuration @p text into @p cfg.
/// @param origin Name used in diagnostics ("<string>" when empty).
/// @return False when an error diagnostic was reported.
bool loadFromString(std::string_view text,
                    Config &cfg,
                    support::DiagnosticEngine &diags,
                    const std::string &origin = {});

/// @brief Parse a boolean spelled true/false, yes/no, on/off or 1/0.
bool parseBool(std::string_view text, bool &out);

/// @brief Parse a KeyMode spelled auto/always/never (or true/false).
bool parseKeyMode(std::string_view text, KeyMode &out);

} // namespace arbor::config
