//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cil/core/Operand.hpp
// Purpose: Declares the closed set of operand payloads an instruction carries.
// Key invariants: OperandKind enumerators follow the Operand alternatives in
//                 declaration order.
// Ownership/Lifetime: Immediates and strings are owned by value; every other
//                     payload is observed through a non-owning pointer.
// Links: ECMA-335 Partition III §1.9
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cil/core/Member.hpp"
#include "cil/core/Signature.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cil::core
{

class Instruction;

/// @brief Ordered branch targets of a switch instruction.
using TargetList = std::vector<const Instruction *>;

/// @brief Operand payload; one alternative per operand kind.
using Operand = std::variant<std::monostate,
                             uint8_t,
                             int8_t,
                             int32_t,
                             int64_t,
                             float,
                             double,
                             std::string,
                             const Instruction *,
                             TargetList,
                             const TypeDefOrRef *,
                             const Field *,
                             const Method *,
                             const TokenOperand *,
                             const MethodSig *,
                             const Parameter *,
                             const Local *>;

/// @brief Discriminator matching the active @ref Operand alternative.
enum class OperandKind : uint8_t
{
    None,
    U8,
    I8,
    I32,
    I64,
    R4,
    R8,
    String,
    Target,
    Targets,
    Type,
    Field,
    Method,
    Token,
    Sig,
    Param,
    Local,
    Count
};

static_assert(std::variant_size_v<Operand> == static_cast<size_t>(OperandKind::Count),
              "OperandKind must list every Operand alternative");

/// @brief Kind of the alternative currently held by @p operand.
inline OperandKind operandKind(const Operand &operand)
{
    return static_cast<OperandKind>(operand.index());
}

/// @brief Lowercase name of @p kind used in diagnostics, e.g. "int32".
std::string_view operandKindName(OperandKind kind);

} // namespace cil::core
