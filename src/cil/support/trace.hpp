//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cil/support/trace.hpp
// Purpose: Declares the environment-gated trace channel used by the library.
// Key invariants: The CIL_TRACE flag is read once per process; tools may
//                 override it afterwards.
// Ownership/Lifetime: Trace lines are written directly to stderr.
// Links: src/cil/support/options.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace cil::support
{

/// @brief Name of the environment variable enabling trace output.
inline constexpr const char *kTraceEnvVar = "CIL_TRACE";

/// @brief Report whether tracing was enabled through @ref kTraceEnvVar.
/// @return True when the variable is set, non-empty, and not "0".
bool isTraceEnabled() noexcept;

/// @brief Force tracing on or off, overriding the environment.
void setTraceEnabled(bool enabled) noexcept;

/// @brief Interpret a flag value the way @ref isTraceEnabled does.
/// @param value Raw environment value; may be null.
bool parseTraceFlag(const char *value) noexcept;

/// @brief Emit one trace line formatted as "[cil:<channel>] <message>".
/// @details No-op unless @ref isTraceEnabled returns true.
void trace(std::string_view channel, std::string_view message);

} // namespace cil::support
