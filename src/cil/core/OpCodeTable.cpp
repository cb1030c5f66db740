//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the opcode lookup. The standard table is expanded from
// OpCodes.def once, on first use, and never mutated afterwards. Lookups by
// encoded value go through two 256-entry index arrays (one per prefix) so
// decoding costs a single array access.
//
//===----------------------------------------------------------------------===//

#include "cil/core/OpCodeTable.hpp"
#include "cil/core/InstrDiag.hpp"

#include <cstdio>
#include <string>
#include <unordered_set>
#include <utility>

namespace cil::core
{

namespace
{
std::vector<OpCode> standardEntries()
{
    return {
#define CIL_OPCODE(NAME, MNEMONIC, CODE, OPERAND, FLOW, KIND, PUSH, POP)                           \
    OpCode{Code::NAME,                                                                             \
           MNEMONIC,                                                                               \
           OperandType::OPERAND,                                                                   \
           FlowControl::FLOW,                                                                      \
           OpCodeType::KIND,                                                                       \
           StackPush::PUSH,                                                                        \
           StackPop::POP},
#include "cil/core/OpCodes.def"
#undef CIL_OPCODE
    };
}

std::string formatCode(Code code)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04X", static_cast<unsigned>(code));
    return buf;
}
} // namespace

OpCodeTable::OpCodeTable(std::vector<OpCode> entries) : entries_(std::move(entries))
{
    oneByte_.fill(kAbsent);
    twoByte_.fill(kAbsent);
    for (size_t i = 0; i < entries_.size(); ++i)
    {
        const auto raw = static_cast<uint16_t>(entries_[i].code);
        auto &slots = (raw >> 8) == kTwoByteEscape ? twoByte_ : oneByte_;
        slots[raw & 0xFF] = static_cast<int16_t>(i);
    }
}

/// @brief Build the ECMA-335 table on first use.
///
/// @details The function-local static gives thread-safe one-time
///          initialisation; the standard entries are known to be unique.
const OpCodeTable &OpCodeTable::standard()
{
    static const OpCodeTable table(standardEntries());
    return table;
}

/// @brief Validate @p entries and build a table from them.
///
/// @details Rejects codes whose high byte is neither zero nor the escape
///          prefix, the bare escape byte itself, duplicate codes, and
///          duplicate mnemonics. The first problem
///          encountered is reported.
cil::support::Expected<OpCodeTable> OpCodeTable::create(std::vector<OpCode> entries)
{
    if (entries.size() > 512)
        return makeInstrError(InstrDiagCode::InvalidOpCodeValue,
                              "table holds " + std::to_string(entries.size()) +
                                  " opcodes; at most 512 can be encoded");

    std::unordered_set<uint16_t> codes;
    std::unordered_set<std::string_view> names;
    for (const auto &entry : entries)
    {
        const auto raw = static_cast<uint16_t>(entry.code);
        const auto high = raw >> 8;
        if (high != 0 && high != kTwoByteEscape)
            return makeInstrError(InstrDiagCode::InvalidOpCodeValue,
                                  "opcode value " + formatCode(entry.code) +
                                      " is neither one-byte nor 0xFE-prefixed");
        if (raw == kTwoByteEscape)
            return makeInstrError(InstrDiagCode::InvalidOpCodeValue,
                                  "opcode value " + formatCode(entry.code) +
                                      " is the two-byte escape prefix");
        if (!codes.insert(raw).second)
            return makeInstrError(InstrDiagCode::DuplicateOpCode,
                                  "opcode value " + formatCode(entry.code) + " listed twice");
        const std::string_view name = entry.name ? entry.name : "";
        if (name.empty())
            return makeInstrError(InstrDiagCode::InvalidOpCodeValue,
                                  "opcode value " + formatCode(entry.code) + " has no mnemonic");
        if (!names.insert(name).second)
            return makeInstrError(InstrDiagCode::DuplicateOpCode,
                                  "mnemonic '" + std::string(name) + "' listed twice");
    }
    return OpCodeTable(std::move(entries));
}

const OpCode *OpCodeTable::find(Code code) const
{
    const auto raw = static_cast<uint16_t>(code);
    const auto high = raw >> 8;
    if (high == 0)
        return raw == kTwoByteEscape ? nullptr : decode(static_cast<uint8_t>(raw));
    if (high == kTwoByteEscape)
        return decode(kTwoByteEscape, static_cast<uint8_t>(raw & 0xFF));
    return nullptr;
}

const OpCode *OpCodeTable::findByName(std::string_view mnemonic) const
{
    for (const auto &entry : entries_)
    {
        if (mnemonic == entry.name)
            return &entry;
    }
    return nullptr;
}

const OpCode *OpCodeTable::decode(uint8_t first, uint8_t second) const
{
    const int16_t index = first == kTwoByteEscape ? twoByte_[second] : oneByte_[first];
    if (index == kAbsent)
        return nullptr;
    return &entries_[static_cast<size_t>(index)];
}

const OpCode &opCode(Code code)
{
    return *OpCodeTable::standard().find(code);
}

std::string_view toString(OperandType type)
{
    switch (type)
    {
        case OperandType::InlineBrTarget:
            return "InlineBrTarget";
        case OperandType::InlineField:
            return "InlineField";
        case OperandType::InlineI:
            return "InlineI";
        case OperandType::InlineI8:
            return "InlineI8";
        case OperandType::InlineMethod:
            return "InlineMethod";
        case OperandType::InlineNone:
            return "InlineNone";
        case OperandType::InlinePhi:
            return "InlinePhi";
        case OperandType::InlineR:
            return "InlineR";
        case OperandType::InlineSig:
            return "InlineSig";
        case OperandType::InlineString:
            return "InlineString";
        case OperandType::InlineSwitch:
            return "InlineSwitch";
        case OperandType::InlineTok:
            return "InlineTok";
        case OperandType::InlineType:
            return "InlineType";
        case OperandType::InlineVar:
            return "InlineVar";
        case OperandType::ShortInlineBrTarget:
            return "ShortInlineBrTarget";
        case OperandType::ShortInlineI:
            return "ShortInlineI";
        case OperandType::ShortInlineR:
            return "ShortInlineR";
        case OperandType::ShortInlineVar:
            return "ShortInlineVar";
    }
    return "?";
}

std::string_view toString(FlowControl flow)
{
    switch (flow)
    {
        case FlowControl::Branch:
            return "Branch";
        case FlowControl::Break:
            return "Break";
        case FlowControl::Call:
            return "Call";
        case FlowControl::CondBranch:
            return "CondBranch";
        case FlowControl::Meta:
            return "Meta";
        case FlowControl::Next:
            return "Next";
        case FlowControl::Phi:
            return "Phi";
        case FlowControl::Return:
            return "Return";
        case FlowControl::Throw:
            return "Throw";
    }
    return "?";
}

std::string_view toString(StackPush push)
{
    switch (push)
    {
        case StackPush::Push0:
            return "Push0";
        case StackPush::Push1:
            return "Push1";
        case StackPush::Push1_push1:
            return "Push1_push1";
        case StackPush::Pushi:
            return "Pushi";
        case StackPush::Pushi8:
            return "Pushi8";
        case StackPush::Pushr4:
            return "Pushr4";
        case StackPush::Pushr8:
            return "Pushr8";
        case StackPush::Pushref:
            return "Pushref";
        case StackPush::Varpush:
            return "Varpush";
    }
    return "?";
}

std::string_view toString(StackPop pop)
{
    switch (pop)
    {
        case StackPop::Pop0:
            return "Pop0";
        case StackPop::Pop1:
            return "Pop1";
        case StackPop::Pop1_pop1:
            return "Pop1_pop1";
        case StackPop::Popi:
            return "Popi";
        case StackPop::Popi_pop1:
            return "Popi_pop1";
        case StackPop::Popi_popi:
            return "Popi_popi";
        case StackPop::Popi_popi8:
            return "Popi_popi8";
        case StackPop::Popi_popi_popi:
            return "Popi_popi_popi";
        case StackPop::Popi_popr4:
            return "Popi_popr4";
        case StackPop::Popi_popr8:
            return "Popi_popr8";
        case StackPop::Popref:
            return "Popref";
        case StackPop::Popref_pop1:
            return "Popref_pop1";
        case StackPop::Popref_popi:
            return "Popref_popi";
        case StackPop::Popref_popi_popi:
            return "Popref_popi_popi";
        case StackPop::Popref_popi_popi8:
            return "Popref_popi_popi8";
        case StackPop::Popref_popi_popr4:
            return "Popref_popi_popr4";
        case StackPop::Popref_popi_popr8:
            return "Popref_popi_popr8";
        case StackPop::Popref_popi_popref:
            return "Popref_popi_popref";
        case StackPop::Popref_popi_pop1:
            return "Popref_popi_pop1";
        case StackPop::PopAll:
            return "PopAll";
        case StackPop::Varpop:
            return "Varpop";
    }
    return "?";
}

} // namespace cil::core
