//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the entry point powering the `cil-opinfo` CLI. The routine is
// factored out of main so tests can drive it with captured streams.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cil/core/OpCodeTable.hpp"
#include "cil/support/options.hpp"

#include <iosfwd>
#include <string_view>

namespace cil::tools::opinfo
{

/// @brief Resolve @p spelling as a mnemonic or a hexadecimal opcode value.
/// @return Descriptor from @p table, or null when nothing matches.
const cil::core::OpCode *lookupOpCode(const cil::core::OpCodeTable &table,
                                      std::string_view spelling);

/// @brief Write the one-line summary of @p op to @p out.
void describeOpCode(const cil::core::OpCode &op,
                    const cil::support::Options &opts,
                    std::ostream &out);

/// @brief Execute the cil-opinfo CLI workflow with injectable streams.
/// @return Zero on success; one on usage errors or unknown opcodes.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace cil::tools::opinfo
