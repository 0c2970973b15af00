//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements argument parsing and execution for arbor-tree.  Configuration is
// layered: defaults, then the optional INI file, then explicit flags.  All
// problems are funnelled through a DiagnosticEngine and printed to the error
// stream before returning an exit code.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "fs_node.hpp"

#include "arbor/charset.hpp"
#include "arbor/config/config.hpp"
#include "arbor/tree_printer.hpp"
#include "arbor/value.hpp"
#include "arbor/version.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace arbor::tools
{

namespace
{
bool parseDepth(std::string_view text, int &out)
{
    try
    {
        size_t parsed = 0;
        const std::string s(text);
        const int v = std::stoi(s, &parsed);
        if (parsed != s.size() || v < 0)
            return false;
        out = v;
        return true;
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
}

/// @brief Sample tree shown by --demo.
Value demoTree()
{
    return Value::vector({
        Value::range(1, 3),
        "foo",
        Value::vector({Value::vector({Value::vector({4, 5}), 6, 7}), 8}),
        Value::dict({{"name", "arbor"}, {"tags", Value::tuple({"tree", "text"})}}),
    });
}
} // namespace

bool parseArgs(ArgvView args, CliOptions &out, support::DiagnosticEngine &diags)
{
    bool havePath = false;
    for (int i = 0; i < args.argc; ++i)
    {
        const std::string_view arg = args.at(i);
        auto needValue = [&](std::string_view flag) -> std::optional<std::string_view>
        {
            if (i + 1 >= args.argc)
            {
                diags.report(support::makeError({}, "missing value for " + std::string(flag)));
                return std::nullopt;
            }
            return args.at(++i);
        };

        if (arg == "-h" || arg == "--help")
        {
            out.showHelp = true;
        }
        else if (arg == "--version")
        {
            out.showVersion = true;
        }
        else if (arg == "--demo")
        {
            out.demo = true;
        }
        else if (arg == "--ascii")
        {
            out.charsetName = "ascii";
        }
        else if (arg == "--no-truncation")
        {
            out.indicateTruncation = false;
        }
        else if (arg == "--keys")
        {
            out.printKeys = KeyMode::Always;
        }
        else if (arg == "--no-keys")
        {
            out.printKeys = KeyMode::Never;
        }
        else if (arg == "--config")
        {
            auto v = needValue(arg);
            if (!v)
                return false;
            out.configPath = std::string(*v);
        }
        else if (arg == "--charset")
        {
            auto v = needValue(arg);
            if (!v)
                return false;
            out.charsetName = std::string(*v);
        }
        else if (arg == "--max-depth")
        {
            auto v = needValue(arg);
            if (!v)
                return false;
            int depth = 0;
            if (!parseDepth(*v, depth))
            {
                diags.report(support::makeError({}, "invalid --max-depth '" + std::string(*v) + "'"));
                return false;
            }
            out.maxDepth = depth;
        }
        else if (!arg.empty() && arg.front() == '-' && arg != "-")
        {
            diags.report(support::makeError({}, "unknown option '" + std::string(arg) + "'"));
            return false;
        }
        else if (havePath)
        {
            diags.report(support::makeError({}, "unexpected argument '" + std::string(arg) + "'"));
            return false;
        }
        else
        {
            out.path = std::string(arg);
            havePath = true;
        }
    }
    return true;
}

bool resolveOptions(const CliOptions &cli, PrintOptions &out, support::DiagnosticEngine &diags)
{
    config::Config cfg;
    if (!cli.configPath.empty() && !config::loadFromFile(cli.configPath, cfg, diags))
        return false;

    if (cli.charsetName)
    {
        auto found = CharacterSet::lookup(*cli.charsetName);
        if (!found.isOk())
        {
            diags.report(support::makeError({}, found.error()));
            return false;
        }
        cfg.options.charset = found.value();
    }
    if (cli.maxDepth)
        cfg.options.maxDepth = *cli.maxDepth;
    if (cli.indicateTruncation)
        cfg.options.indicateTruncation = *cli.indicateTruncation;
    if (cli.printKeys)
        cfg.options.printKeys = *cli.printKeys;

    out = cfg.options;
    return true;
}

int runTreeTool(const CliOptions &cli, std::ostream &out, std::ostream &err)
{
    if (cli.showHelp)
    {
        printUsage(out);
        return kExitOk;
    }
    if (cli.showVersion)
    {
        out << "arbor-tree v" << arbor_version() << "\n";
        return kExitOk;
    }

    support::DiagnosticEngine diags;
    PrintOptions options;
    const bool resolved = resolveOptions(cli, options, diags);
    diags.printAll(err);
    if (!resolved)
        return kExitUsageError;

    try
    {
        if (cli.demo)
        {
            printTree(out, demoTree(), options);
            return kExitOk;
        }

        const std::filesystem::path root(cli.path);
        if (!std::filesystem::exists(std::filesystem::symlink_status(root)))
        {
            support::printDiag(support::makeError(cli.path, "no such file or directory"), err);
            return kExitRuntimeError;
        }
        printTree(out, FsNode(root, true), options);
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        support::printDiag(support::makeError(e.path1().string(), e.code().message()), err);
        return kExitRuntimeError;
    }
    catch (const OutputError &e)
    {
        support::printDiag(support::makeError({}, e.what()), err);
        return kExitRuntimeError;
    }
    return kExitOk;
}

void printUsage(std::ostream &os)
{
    os << "arbor-tree v" << arbor_version() << " - print a directory tree\n"
       << "\n"
       << "Usage: arbor-tree [options] [PATH]\n"
       << "\n"
       << "Options:\n"
       << "  --config FILE        Read print settings from an INI file\n"
       << "  --max-depth N        Stop expanding below depth N (default 5)\n"
       << "  --ascii              Draw branches with ASCII characters\n"
       << "  --charset NAME       Branch character set: unicode or ascii\n"
       << "  --no-truncation      Omit the marker under truncated subtrees\n"
       << "  --keys, --no-keys    Force or suppress child key labels\n"
       << "  --demo               Print a built-in sample tree\n"
       << "  -h, --help           Show this help message\n"
       << "  --version            Show version information\n";
}

} // namespace arbor::tools
