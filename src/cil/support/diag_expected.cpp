//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library. The utilities here wrap diagnostics around the Expected type,
// provide the severity-to-string mapping, and print diagnostics in the single
// format every tool shares.
//
//===----------------------------------------------------------------------===//

#include "cil/support/diag_expected.hpp"

namespace cil::support
{
namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
///
/// @details New severity enumerators should extend this switch to keep the
///          wording predictable across command-line tools.
const char *diagSeverityToString(Severity severity)
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
} // namespace detail

/// @brief Build an error diagnostic with the provided message.
Diag makeError(std::string msg)
{
    return Diag{Severity::Error, std::move(msg)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details Emits "<severity>: <message>" followed by a newline so multiple
///          diagnostics appear as a contiguous block.
void printDiag(const Diag &diag, std::ostream &os)
{
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace cil::support
