//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the opcode descriptor consumed by the instruction core.
// A descriptor couples an encoded opcode value with the static metadata the
// encoder and the stack analysis need: the operand shape, the flow-control
// class, and the push/pop stack-behaviour classes.
//
// Descriptors are plain values. The standard ECMA-335 set is materialised from
// OpCodes.def by OpCodeTable; tests and custom instruction sets may build their
// own descriptors and tables without touching process-wide state.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string_view>

namespace cil::core
{

/// @brief Encoded opcode values. Two-byte opcodes carry 0xFE in the high byte.
enum class Code : uint16_t
{
#define CIL_OPCODE(NAME, MNEMONIC, CODE, ...) NAME = CODE,
#include "cil/core/OpCodes.def"
#undef CIL_OPCODE
};

/// @brief Escape byte introducing a two-byte opcode.
inline constexpr uint8_t kTwoByteEscape = 0xFE;

/// @brief Shape of the inline operand that follows the opcode bytes.
enum class OperandType : uint8_t
{
    InlineBrTarget,      ///< 4-byte branch displacement.
    InlineField,         ///< Field token.
    InlineI,             ///< 4-byte integer.
    InlineI8,            ///< 8-byte integer.
    InlineMethod,        ///< Method token.
    InlineNone,          ///< No operand.
    InlinePhi,           ///< Reserved; never encoded.
    InlineR,             ///< 8-byte float.
    InlineSig,           ///< Stand-alone signature token.
    InlineString,        ///< User-string token.
    InlineSwitch,        ///< Target count followed by 4-byte displacements.
    InlineTok,           ///< Type, field or method token.
    InlineType,          ///< Type token.
    InlineVar,           ///< 2-byte local or argument index.
    ShortInlineBrTarget, ///< 1-byte branch displacement.
    ShortInlineI,        ///< 1-byte integer.
    ShortInlineR,        ///< 4-byte float.
    ShortInlineVar       ///< 1-byte local or argument index.
};

/// @brief Effect of an opcode on control flow.
enum class FlowControl : uint8_t
{
    Branch,
    Break,
    Call,
    CondBranch,
    Meta,
    Next,
    Phi,
    Return,
    Throw
};

/// @brief Opcode family as catalogued by ECMA-335.
enum class OpCodeType : uint8_t
{
    Annotation,
    Macro,
    Nternal,
    Objmodel,
    Prefix,
    Primitive
};

/// @brief Static push behaviour of an opcode.
enum class StackPush : uint8_t
{
    Push0,
    Push1,
    Push1_push1,
    Pushi,
    Pushi8,
    Pushr4,
    Pushr8,
    Pushref,
    Varpush ///< Determined by a call signature.
};

/// @brief Static pop behaviour of an opcode.
enum class StackPop : uint8_t
{
    Pop0,
    Pop1,
    Pop1_pop1,
    Popi,
    Popi_pop1,
    Popi_popi,
    Popi_popi8,
    Popi_popi_popi,
    Popi_popr4,
    Popi_popr8,
    Popref,
    Popref_pop1,
    Popref_popi,
    Popref_popi_popi,
    Popref_popi_popi8,
    Popref_popi_popr4,
    Popref_popi_popr8,
    Popref_popi_popref,
    Popref_popi_pop1,
    PopAll, ///< Clears the evaluation stack.
    Varpop  ///< Determined by a call signature or the method return type.
};

/// @brief Static description of one opcode.
struct OpCode
{
    Code code;                ///< Encoded value.
    const char *name;         ///< Canonical mnemonic.
    OperandType operandType;  ///< Inline operand shape.
    FlowControl flowControl;  ///< Control-flow class.
    OpCodeType opCodeType;    ///< ECMA-335 family.
    StackPush push;           ///< Push behaviour.
    StackPop pop;             ///< Pop behaviour.

    /// @brief Number of bytes the opcode itself occupies (1 or 2).
    [[nodiscard]] constexpr uint32_t size() const
    {
        return (static_cast<uint16_t>(code) >> 8) == kTwoByteEscape ? 2u : 1u;
    }
};

/// @brief Stable name of an operand type, e.g. "InlineI".
std::string_view toString(OperandType type);

/// @brief Stable name of a flow-control class, e.g. "CondBranch".
std::string_view toString(FlowControl flow);

/// @brief Stable name of a push class, e.g. "Push1_push1".
std::string_view toString(StackPush push);

/// @brief Stable name of a pop class, e.g. "Popref_popi".
std::string_view toString(StackPop pop);

} // namespace cil::core
