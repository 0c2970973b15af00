//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/arbor/support/diagnostics.hpp
// Purpose: Declares the diagnostic engine used to report warnings and errors.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace arbor::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with an optional origin.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    std::string origin;  ///< "file:line" or empty when unknown
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    void printAll(std::ostream &os) const;

    /// @brief Access the recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

/// @brief Convert diagnostic severity to lowercase string.
const char *severityToString(Severity severity);

/// @brief Print a single diagnostic as `origin: severity: message`.
void printDiag(const Diagnostic &diag, std::ostream &os);

/// @brief Shorthand for an error diagnostic.
Diagnostic makeError(std::string origin, std::string msg);

/// @brief Shorthand for a warning diagnostic.
Diagnostic makeWarning(std::string origin, std::string msg);

} // namespace arbor::support
