/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The engine aggregates warnings and errors raised while loading
 *     configuration or walking host trees and keeps track of severity counts.
 *     Diagnostics are stored until callers explicitly print or inspect them.
 */
#include "arbor/support/diagnostics.hpp"

#include <utility>

namespace arbor::support
{

/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * Notes are stored but do not affect either counter.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

const char *severityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}

/**
 * @brief Format one diagnostic on its own line.
 *
 * The origin prefix is omitted when the diagnostic carries none, which keeps
 * messages produced outside of any file readable.
 */
void printDiag(const Diagnostic &diag, std::ostream &os)
{
    if (!diag.origin.empty())
        os << diag.origin << ": ";
    os << severityToString(diag.severity) << ": " << diag.message << '\n';
}

Diagnostic makeError(std::string origin, std::string msg)
{
    return Diagnostic{Severity::Error, std::move(msg), std::move(origin)};
}

Diagnostic makeWarning(std::string origin, std::string msg)
{
    return Diagnostic{Severity::Warning, std::move(msg), std::move(origin)};
}

} // namespace arbor::support
