//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the arbor-tree command-line tool.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <iostream>

/// @brief Parse the command line and delegate to @ref arbor::tools::runTreeTool.
/// @return Exit status; 2 on usage errors.
int main(int argc, char **argv)
{
    using namespace arbor::tools;

    CliOptions cli;
    arbor::support::DiagnosticEngine diags;
    if (!parseArgs(ArgvView{argc, argv}.drop_front(), cli, diags))
    {
        diags.printAll(std::cerr);
        printUsage(std::cerr);
        return kExitUsageError;
    }
    return runTreeTool(cli, std::cout, std::cerr);
}
