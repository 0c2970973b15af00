// src/config/config.cpp
// @brief INI-like configuration loader implementation.
// @invariant Reads sections [tree] and [charset].
// @ownership Loader does not own external resources beyond file path.

#include "arbor/config/config.hpp"

#include "arbor/charset.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace arbor::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lower(std::string s)
{
    std::transform(s.begin(),
                   s.end(),
                   s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Strip one pair of surrounding double quotes, keeping inner spaces.
std::string unquote(const std::string &value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
    {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool parse_depth(const std::string &s, int &out)
{
    try
    {
        size_t parsed = 0;
        const int v = std::stoi(s, &parsed);
        if (parsed != s.size() || v < 0)
        {
            return false;
        }
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

std::optional<std::string> *glyph_slot(CharacterSet::Overrides &ov, const std::string &key)
{
    if (key == "mid")
        return &ov.mid;
    if (key == "terminator")
        return &ov.terminator;
    if (key == "skip")
        return &ov.skip;
    if (key == "dash")
        return &ov.dash;
    if (key == "trunc")
        return &ov.trunc;
    if (key == "pair")
        return &ov.pair;
    return nullptr;
}
} // namespace

bool parseBool(std::string_view text, bool &out)
{
    const std::string v = lower(std::string(text));
    if (v == "true" || v == "yes" || v == "on" || v == "1")
    {
        out = true;
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0")
    {
        out = false;
        return true;
    }
    return false;
}

bool parseKeyMode(std::string_view text, KeyMode &out)
{
    const std::string v = lower(std::string(text));
    if (v == "auto")
    {
        out = KeyMode::Auto;
        return true;
    }
    if (v == "always" || v == "true")
    {
        out = KeyMode::Always;
        return true;
    }
    if (v == "never" || v == "false")
    {
        out = KeyMode::Never;
        return true;
    }
    return false;
}

bool loadFromString(std::string_view text,
                    Config &cfg,
                    support::DiagnosticEngine &diags,
                    const std::string &origin)
{
    const std::string name = origin.empty() ? "<string>" : origin;
    const size_t errorsBefore = diags.errorCount();

    CharacterSet base = cfg.options.charset;
    CharacterSet::Overrides overrides;

    std::istringstream in{std::string(text)};
    std::string line;
    std::string section;
    int lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        const std::string where = name + ":" + std::to_string(lineNo);
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';')
        {
            continue;
        }
        if (line.front() == '[')
        {
            if (line.back() != ']')
            {
                diags.report(support::makeWarning(where, "malformed section header '" + line + "'"));
                section.clear();
                continue;
            }
            section = lower(trim(std::string_view(line).substr(1, line.size() - 2)));
            if (section != "tree" && section != "charset")
            {
                diags.report(support::makeWarning(where, "unknown section [" + section + "]"));
            }
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos)
        {
            diags.report(support::makeWarning(where, "expected key = value"));
            continue;
        }
        const std::string key = lower(trim(std::string_view(line).substr(0, eq)));
        const std::string value = unquote(trim(std::string_view(line).substr(eq + 1)));

        if (section == "tree")
        {
            if (key == "max_depth")
            {
                if (!parse_depth(value, cfg.options.maxDepth))
                {
                    diags.report(support::makeWarning(where, "invalid max_depth '" + value + "'"));
                }
            }
            else if (key == "indicate_truncation")
            {
                if (!parseBool(value, cfg.options.indicateTruncation))
                {
                    diags.report(
                        support::makeWarning(where, "invalid indicate_truncation '" + value + "'"));
                }
            }
            else if (key == "charset")
            {
                auto found = CharacterSet::lookup(value);
                if (found.isOk())
                {
                    base = found.value();
                }
                else
                {
                    diags.report(support::makeError(where, found.error()));
                }
            }
            else if (key == "print_keys")
            {
                if (!parseKeyMode(value, cfg.options.printKeys))
                {
                    diags.report(support::makeWarning(where, "invalid print_keys '" + value + "'"));
                }
            }
            else
            {
                diags.report(support::makeWarning(where, "unknown key '" + key + "' in [tree]"));
            }
        }
        else if (section == "charset")
        {
            auto *slot = glyph_slot(overrides, key);
            if (!slot)
            {
                diags.report(support::makeWarning(where, "unknown glyph '" + key + "' in [charset]"));
            }
            else if (value.empty())
            {
                diags.report(support::makeWarning(where, "empty glyph for '" + key + "'"));
            }
            else
            {
                *slot = value;
            }
        }
        else if (section.empty())
        {
            diags.report(support::makeWarning(where, "key '" + key + "' outside of any section"));
        }
    }

    cfg.options.charset = CharacterSet(base, overrides);
    return diags.errorCount() == errorsBefore;
}

bool loadFromFile(const std::string &path, Config &cfg, support::DiagnosticEngine &diags)
{
    std::ifstream in(path);
    if (!in)
    {
        diags.report(support::makeError(path, "cannot open configuration file"));
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return loadFromString(ss.str(), cfg, diags, path);
}

} // namespace arbor::config
