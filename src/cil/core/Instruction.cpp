//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the validated instruction factories and the read-side helpers.
// Every factory funnels through makeChecked, which either wraps the payload in
// an Instruction or produces an InvalidOperand diagnostic naming the opcode,
// the operand type it declares, the operand kind that was supplied and the
// operand type the factory requires.
//
//===----------------------------------------------------------------------===//

#include "cil/core/Instruction.hpp"
#include "cil/core/InstrDiag.hpp"
#include "cil/support/trace.hpp"

#include <string_view>

namespace cil::core
{

namespace
{
bool isBranchTarget(const OpCode &op)
{
    return op.operandType == OperandType::ShortInlineBrTarget ||
           op.operandType == OperandType::InlineBrTarget;
}

bool isVariable(const OpCode &op)
{
    return op.operandType == OperandType::ShortInlineVar ||
           op.operandType == OperandType::InlineVar;
}

cil::support::Diag invalidOperand(const OpCode &op, OperandKind supplied, std::string_view expected)
{
    std::string msg = "opcode '";
    msg += op.name;
    msg += "' (";
    msg += toString(op.operandType);
    msg += ") cannot take ";
    msg += operandKindName(supplied);
    msg += " operand; expected ";
    msg += expected;
    cil::support::trace("instr", msg);
    return makeInstrError(InstrDiagCode::InvalidOperand, std::move(msg));
}

/// @brief Wrap @p operand when @p accepted holds, otherwise report the mismatch.
/// @param expected Operand type (or opcode) the factory requires, for the diagnostic.
Instruction::Result makeChecked(bool accepted,
                                const OpCode &op,
                                Operand operand,
                                std::string_view expected)
{
    if (!accepted)
        return invalidOperand(op, cil::core::operandKind(operand), expected);
    return Instruction::createUnchecked(op, std::move(operand));
}
} // namespace

std::string_view operandKindName(OperandKind kind)
{
    switch (kind)
    {
        case OperandKind::None:
            return "no";
        case OperandKind::U8:
            return "uint8";
        case OperandKind::I8:
            return "int8";
        case OperandKind::I32:
            return "int32";
        case OperandKind::I64:
            return "int64";
        case OperandKind::R4:
            return "float32";
        case OperandKind::R8:
            return "float64";
        case OperandKind::String:
            return "string";
        case OperandKind::Target:
            return "branch target";
        case OperandKind::Targets:
            return "switch target list";
        case OperandKind::Type:
            return "type";
        case OperandKind::Field:
            return "field";
        case OperandKind::Method:
            return "method";
        case OperandKind::Token:
            return "token";
        case OperandKind::Sig:
            return "method signature";
        case OperandKind::Param:
            return "parameter";
        case OperandKind::Local:
            return "local";
        case OperandKind::Count:
            break;
    }
    return "unknown";
}

Instruction Instruction::createUnchecked(const OpCode &op, Operand operand)
{
    return Instruction(op, std::move(operand));
}

Instruction::Result Instruction::createNone(const OpCode &op)
{
    return makeChecked(op.operandType == OperandType::InlineNone, op, std::monostate{}, "InlineNone");
}

// ShortInlineI is shared by `unaligned.`, `no.` and `ldc.i4.s`; only the
// first reads an unsigned byte and only the last a signed one.
Instruction::Result Instruction::createU8(const OpCode &op, uint8_t value)
{
    return makeChecked(op.code == Code::Unaligned, op, value, "opcode 'unaligned.'");
}

Instruction::Result Instruction::createI8(const OpCode &op, int8_t value)
{
    return makeChecked(op.code == Code::Ldc_I4_S, op, value, "opcode 'ldc.i4.s'");
}

Instruction::Result Instruction::createI32(const OpCode &op, int32_t value)
{
    return makeChecked(op.operandType == OperandType::InlineI, op, value, "InlineI");
}

Instruction::Result Instruction::createI64(const OpCode &op, int64_t value)
{
    return makeChecked(op.operandType == OperandType::InlineI8, op, value, "InlineI8");
}

Instruction::Result Instruction::createR4(const OpCode &op, float value)
{
    return makeChecked(op.operandType == OperandType::ShortInlineR, op, value, "ShortInlineR");
}

Instruction::Result Instruction::createR8(const OpCode &op, double value)
{
    return makeChecked(op.operandType == OperandType::InlineR, op, value, "InlineR");
}

Instruction::Result Instruction::createString(const OpCode &op, std::string value)
{
    return makeChecked(
        op.operandType == OperandType::InlineString, op, std::move(value), "InlineString");
}

Instruction::Result Instruction::createBranch(const OpCode &op, const Instruction &target)
{
    return makeChecked(
        isBranchTarget(op), op, &target, "ShortInlineBrTarget or InlineBrTarget");
}

Instruction::Result Instruction::createSwitch(const OpCode &op, TargetList targets)
{
    return makeChecked(
        op.operandType == OperandType::InlineSwitch, op, std::move(targets), "InlineSwitch");
}

Instruction::Result Instruction::createType(const OpCode &op, const TypeDefOrRef &type)
{
    return makeChecked(op.operandType == OperandType::InlineType, op, &type, "InlineType");
}

Instruction::Result Instruction::createField(const OpCode &op, const Field &field)
{
    return makeChecked(op.operandType == OperandType::InlineField, op, &field, "InlineField");
}

Instruction::Result Instruction::createMethod(const OpCode &op, const Method &method)
{
    return makeChecked(op.operandType == OperandType::InlineMethod, op, &method, "InlineMethod");
}

Instruction::Result Instruction::createToken(const OpCode &op, const TokenOperand &token)
{
    return makeChecked(op.operandType == OperandType::InlineTok, op, &token, "InlineTok");
}

Instruction::Result Instruction::createSig(const OpCode &op, const MethodSig &sig)
{
    return makeChecked(op.operandType == OperandType::InlineSig, op, &sig, "InlineSig");
}

Instruction::Result Instruction::createParam(const OpCode &op, const Parameter &param)
{
    return makeChecked(isVariable(op), op, &param, "ShortInlineVar or InlineVar");
}

Instruction::Result Instruction::createLocal(const OpCode &op, const Local &local)
{
    return makeChecked(isVariable(op), op, &local, "ShortInlineVar or InlineVar");
}

const Instruction *Instruction::target() const
{
    const auto *target = operandIf<const Instruction *>();
    return target ? *target : nullptr;
}

const TargetList *Instruction::targets() const
{
    return operandIf<TargetList>();
}

const Method *Instruction::method() const
{
    const auto *method = operandIf<const Method *>();
    return method ? *method : nullptr;
}

bool Instruction::isBranch() const
{
    return opCode_->flowControl == FlowControl::Branch ||
           opCode_->flowControl == FlowControl::CondBranch;
}

bool Instruction::isConditionalBranch() const
{
    return opCode_->flowControl == FlowControl::CondBranch;
}

bool Instruction::isLeave() const
{
    return opCode_->code == Code::Leave || opCode_->code == Code::Leave_S;
}

std::optional<int32_t> Instruction::ldcI4Value() const
{
    switch (opCode_->code)
    {
        case Code::Ldc_I4_M1:
            return -1;
        case Code::Ldc_I4_0:
            return 0;
        case Code::Ldc_I4_1:
            return 1;
        case Code::Ldc_I4_2:
            return 2;
        case Code::Ldc_I4_3:
            return 3;
        case Code::Ldc_I4_4:
            return 4;
        case Code::Ldc_I4_5:
            return 5;
        case Code::Ldc_I4_6:
            return 6;
        case Code::Ldc_I4_7:
            return 7;
        case Code::Ldc_I4_8:
            return 8;
        case Code::Ldc_I4_S:
            if (const auto *value = operandIf<int8_t>())
                return *value;
            return std::nullopt;
        case Code::Ldc_I4:
            if (const auto *value = operandIf<int32_t>())
                return *value;
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

} // namespace cil::core
