// File: apps/cli.hpp
// Purpose: Declarations for the arbor-tree command-line front end.
// Key invariants: Command-line flags override values loaded from --config.
// Ownership/Lifetime: CliOptions is a plain value type.
// Links: DESIGN.md

#pragma once

#include "argv_view.hpp"

#include "arbor/print_options.hpp"
#include "arbor/support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace arbor::tools
{

/// @brief Exit codes returned by @ref runTreeTool.
enum ExitCode : int
{
    kExitOk = 0,
    kExitRuntimeError = 1,
    kExitUsageError = 2
};

/// @brief Parsed command line of arbor-tree.
struct CliOptions
{
    /// Configuration file applied before command-line overrides.
    std::string configPath{};

    std::optional<int> maxDepth{};
    std::optional<std::string> charsetName{};
    std::optional<bool> indicateTruncation{};
    std::optional<KeyMode> printKeys{};

    /// Print the built-in sample value tree instead of a directory.
    bool demo = false;

    bool showHelp = false;
    bool showVersion = false;

    /// Directory or file to print.
    std::string path = ".";
};

/// @brief Parse the arguments following the program name.
/// @return False when a usage error was reported to @p diags.
bool parseArgs(ArgvView args, CliOptions &out, support::DiagnosticEngine &diags);

/// @brief Combine the config file and command-line overrides into print options.
/// @return False when the configuration could not be loaded.
bool resolveOptions(const CliOptions &cli, PrintOptions &out, support::DiagnosticEngine &diags);

/// @brief Run arbor-tree with already parsed options.
/// @return One of the ExitCode values.
int runTreeTool(const CliOptions &cli, std::ostream &out, std::ostream &err);

/// @brief Print usage text to @p os.
void printUsage(std::ostream &os);

} // namespace arbor::tools
