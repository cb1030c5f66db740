//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares Instruction, a single CIL instruction: an opcode, its
// operand, and its byte offset inside the method body.
//
// Construction goes through one validated factory per operand kind. Each
// factory checks the requested payload against the opcode's operand type and
// returns an InvalidOperand diagnostic instead of an instruction when they do
// not agree, so a validly constructed instruction always pairs its opcode with
// a matching operand. createUnchecked skips every check; it exists for
// decoders that already validated the bytes against the same opcode table or
// that must keep malformed input around for later diagnosis.
//
// Ownership Model:
// - The opcode descriptor is observed; its table must outlive the instruction.
// - Immediates and strings are owned by value.
// - Branch targets, members and variables are observed, never owned. A target
//   may be shared by any number of branches.
//
// The offset is written once by a layout pass before any concurrent reader
// looks at it; all other state is fixed at construction.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cil/core/OpCode.hpp"
#include "cil/core/Operand.hpp"
#include "cil/support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace cil::core
{

class Instruction
{
  public:
    using Result = cil::support::Expected<Instruction>;

    /// @name Validated factories
    /// @{

    /// @brief Instruction without operand; requires InlineNone.
    static Result createNone(const OpCode &op);

    /// @brief Unsigned byte operand; only valid on `unaligned.`.
    static Result createU8(const OpCode &op, uint8_t value);

    /// @brief Signed byte operand; only valid on `ldc.i4.s`.
    static Result createI8(const OpCode &op, int8_t value);

    /// @brief 32-bit integer operand; requires InlineI.
    static Result createI32(const OpCode &op, int32_t value);

    /// @brief 64-bit integer operand; requires InlineI8.
    static Result createI64(const OpCode &op, int64_t value);

    /// @brief 32-bit float operand; requires ShortInlineR.
    static Result createR4(const OpCode &op, float value);

    /// @brief 64-bit float operand; requires InlineR.
    static Result createR8(const OpCode &op, double value);

    /// @brief User string operand; requires InlineString.
    static Result createString(const OpCode &op, std::string value);

    /// @brief Branch target; requires ShortInlineBrTarget or InlineBrTarget.
    static Result createBranch(const OpCode &op, const Instruction &target);

    /// @brief Switch targets; requires InlineSwitch.
    static Result createSwitch(const OpCode &op, TargetList targets);

    /// @brief Type operand; requires InlineType.
    static Result createType(const OpCode &op, const TypeDefOrRef &type);

    /// @brief Field operand; requires InlineField.
    static Result createField(const OpCode &op, const Field &field);

    /// @brief Method operand; requires InlineMethod.
    static Result createMethod(const OpCode &op, const Method &method);

    /// @brief Token operand; requires InlineTok.
    static Result createToken(const OpCode &op, const TokenOperand &token);

    /// @brief Stand-alone signature operand; requires InlineSig.
    static Result createSig(const OpCode &op, const MethodSig &sig);

    /// @brief Argument operand; requires ShortInlineVar or InlineVar.
    static Result createParam(const OpCode &op, const Parameter &param);

    /// @brief Local operand; requires ShortInlineVar or InlineVar.
    static Result createLocal(const OpCode &op, const Local &local);

    /// @}

    /// @brief Pair @p op with @p operand without any validation.
    /// @warning The result carries no opcode/operand agreement guarantee.
    static Instruction createUnchecked(const OpCode &op, Operand operand = {});

    [[nodiscard]] const OpCode &opCode() const
    {
        return *opCode_;
    }

    [[nodiscard]] const Operand &operand() const
    {
        return operand_;
    }

    [[nodiscard]] OperandKind operandKind() const
    {
        return cil::core::operandKind(operand_);
    }

    /// @brief Active operand alternative as @p T; null when another is held.
    template <class T> [[nodiscard]] const T *operandIf() const
    {
        return std::get_if<T>(&operand_);
    }

    /// @brief Byte offset inside the method body; zero until laid out.
    [[nodiscard]] uint32_t offset() const
    {
        return offset_;
    }

    /// @brief Record the byte offset assigned by the layout pass.
    void setOffset(uint32_t offset)
    {
        offset_ = offset;
    }

    /// @brief Single branch target, or null.
    [[nodiscard]] const Instruction *target() const;

    /// @brief Switch targets, or null.
    [[nodiscard]] const TargetList *targets() const;

    /// @brief Method operand, or null.
    [[nodiscard]] const Method *method() const;

    /// @brief Unconditional or conditional branch, including switch and leave.
    [[nodiscard]] bool isBranch() const;

    /// @brief Branch that depends on a stack value (brtrue, beq, switch, ...).
    [[nodiscard]] bool isConditionalBranch() const;

    /// @brief `leave` or `leave.s`.
    [[nodiscard]] bool isLeave() const;

    /// @brief Constant pushed by an ldc.i4 family instruction.
    /// @return The constant, or nullopt for any other opcode or a malformed operand.
    [[nodiscard]] std::optional<int32_t> ldcI4Value() const;

  private:
    Instruction(const OpCode &op, Operand operand) : opCode_(&op), operand_(std::move(operand)) {}

    const OpCode *opCode_;
    Operand operand_;
    uint32_t offset_ = 0;
};

} // namespace cil::core
