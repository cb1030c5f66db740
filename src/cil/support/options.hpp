//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cil/support/options.hpp
// Purpose: Declares settings shared by the command-line tools.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values.
// Links: src/tools/cil-opinfo/driver.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cil/support/trace.hpp"

namespace cil::support
{

/// @brief Holds global settings that influence tool behaviour.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct Options
{
    /// @brief Echo trace lines to stderr while processing.
    bool trace = false;

    /// @brief Assume the enclosing method returns a value when evaluating `ret`.
    bool methodHasReturnValue = false;

    /// @brief Build options seeded from the process environment.
    static Options fromEnvironment()
    {
        Options opts;
        opts.trace = isTraceEnabled();
        return opts;
    }
};

} // namespace cil::support
