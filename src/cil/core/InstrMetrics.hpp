//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cil/core/InstrMetrics.hpp
// Purpose: Declares encoded-size and stack-effect queries over instructions.
// Key invariants: Both queries are pure; they read only the opcode descriptor
//                 and the operand.
// Ownership/Lifetime: Stateless free functions.
// Links: ECMA-335 Partition III §1.2, §1.9
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cil/core/Instruction.hpp"

#include <cstdint>
#include <ostream>

namespace cil::core
{

/// @brief Values pushed and popped by one instruction.
struct StackEffect
{
    /// @brief Pop count meaning "the whole evaluation stack is discarded".
    static constexpr int kPopAll = -1;

    int pushes = 0;
    int pops = 0;

    [[nodiscard]] bool clearsStack() const
    {
        return pops == kPopAll;
    }

    bool operator==(const StackEffect &other) const
    {
        return pushes == other.pushes && pops == other.pops;
    }

    bool operator!=(const StackEffect &other) const
    {
        return !(*this == other);
    }
};

/// @brief Print as "<pushes>/<pops>", with "all" for the discard sentinel.
std::ostream &operator<<(std::ostream &os, const StackEffect &effect);

/// @brief Number of bytes @p instr occupies once encoded.
/// @details Opcode length plus the operand length implied by the operand type.
///          Switch instructions add four bytes per target on top of the
///          four-byte count; a missing target list counts as empty.
uint32_t encodedSize(const Instruction &instr);

/// @brief Stack effect of @p instr.
/// @param methodHasReturnValue Whether the enclosing method returns a value;
///        consulted only for the Varpop class of `ret`.
/// @details Call-family opcodes derive the effect from the signature of their
///          method operand and report {0, 0} for any other operand or an
///          unresolved signature. All other
///          opcodes use their static push/pop classes.
StackEffect stackEffect(const Instruction &instr, bool methodHasReturnValue = false);

} // namespace cil::core
