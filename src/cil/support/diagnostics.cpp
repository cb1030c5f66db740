//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cil/support/diagnostics.cpp
// Purpose: Implements the collecting diagnostic engine.
// Key invariants: Error and warning counters track reported diagnostics.
// Ownership/Lifetime: Engine owns stored diagnostics.
// Links: src/cil/support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#include "cil/support/diagnostics.hpp"
#include "cil/support/diag_expected.hpp"

#include <utility>

namespace cil::support
{

/// @brief Record a diagnostic and update the severity counters.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Print every stored diagnostic in arrival order.
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
        printDiag(d, os);
}

const std::vector<Diagnostic> &DiagnosticEngine::diagnostics() const
{
    return diags_;
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

} // namespace cil::support
