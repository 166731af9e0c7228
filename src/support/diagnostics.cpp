//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine. Diagnostics are stored until callers print
// or inspect them; the engine keeps running error and warning counts so the
// optimizer can summarise a batch of blocks without re-scanning.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"

#include <utility>

namespace talus::support
{

/// @brief Add a diagnostic and update the severity counters.
///
/// Notes leave both counters unchanged.
///
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Write every stored diagnostic to @p os in report order.
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

const std::vector<Diagnostic> &DiagnosticEngine::all() const
{
    return diags_;
}

} // namespace talus::support
