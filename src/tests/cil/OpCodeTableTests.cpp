//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/cil/OpCodeTableTests.cpp
// Purpose: Check the standard opcode table and synthetic table construction.
// Key invariants: Codes and mnemonics are unique; lookups agree with each other.
// Ownership/Lifetime: Uses the read-only standard table and local tables.
// Links: src/cil/core/OpCodes.def
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "cil/core/InstrDiag.hpp"
#include "cil/core/OpCodeTable.hpp"

#include <set>
#include <string>

using namespace cil::core;

TEST(OpCodeTable, StandardTableListsEveryOpcodeOnce)
{
    const auto &table = OpCodeTable::standard();
    ASSERT_EQ(table.size(), 219u);

    std::set<uint16_t> codes;
    std::set<std::string> names;
    size_t twoByte = 0;
    for (const auto &op : table.entries())
    {
        EXPECT_TRUE(codes.insert(static_cast<uint16_t>(op.code)).second) << op.name;
        EXPECT_TRUE(names.insert(op.name).second) << op.name;
        if (op.size() == 2)
            ++twoByte;
    }
    EXPECT_EQ(twoByte, 28u);
}

TEST(OpCodeTable, LookupsAgree)
{
    const auto &table = OpCodeTable::standard();
    for (const auto &op : table.entries())
    {
        EXPECT_EQ(table.find(op.code), &op);
        EXPECT_EQ(table.findByName(op.name), &op);
        const auto raw = static_cast<uint16_t>(op.code);
        if (op.size() == 2)
        {
            EXPECT_EQ(raw >> 8, kTwoByteEscape);
            EXPECT_EQ(table.decode(kTwoByteEscape, static_cast<uint8_t>(raw)), &op);
        }
        else
        {
            EXPECT_EQ(raw >> 8, 0);
            EXPECT_EQ(table.decode(static_cast<uint8_t>(raw)), &op);
        }
    }
}

TEST(OpCodeTable, UnassignedValuesAreAbsent)
{
    const auto &table = OpCodeTable::standard();
    EXPECT_EQ(table.decode(0x24), nullptr);
    EXPECT_EQ(table.decode(0xA6), nullptr);
    EXPECT_EQ(table.decode(kTwoByteEscape, 0x08), nullptr);
    EXPECT_EQ(table.decode(kTwoByteEscape, 0x1F), nullptr);
    EXPECT_EQ(table.findByName("ldc.i4.9"), nullptr);
    EXPECT_EQ(table.find(static_cast<Code>(0x1234)), nullptr);
}

TEST(OpCodeTable, DescribesRepresentativeOpcodes)
{
    const OpCode &dup = opCode(Code::Dup);
    EXPECT_STREQ(dup.name, "dup");
    EXPECT_EQ(dup.push, StackPush::Push1_push1);
    EXPECT_EQ(dup.pop, StackPop::Pop1);

    const OpCode &ret = opCode(Code::Ret);
    EXPECT_EQ(ret.flowControl, FlowControl::Return);
    EXPECT_EQ(ret.pop, StackPop::Varpop);

    const OpCode &leave = opCode(Code::Leave_S);
    EXPECT_EQ(leave.operandType, OperandType::ShortInlineBrTarget);
    EXPECT_EQ(leave.pop, StackPop::PopAll);

    const OpCode &ceq = opCode(Code::Ceq);
    EXPECT_EQ(static_cast<uint16_t>(ceq.code), 0xFE01);
    EXPECT_EQ(ceq.size(), 2u);

    const OpCode &calli = opCode(Code::Calli);
    EXPECT_EQ(calli.operandType, OperandType::InlineSig);
    EXPECT_EQ(calli.flowControl, FlowControl::Call);
}

TEST(OpCodeTable, CallFlowIsLimitedToInvocationOpcodes)
{
    std::set<std::string> callers;
    for (const auto &op : OpCodeTable::standard().entries())
        if (op.flowControl == FlowControl::Call)
            callers.insert(op.name);
    EXPECT_EQ(callers, (std::set<std::string>{"call", "calli", "callvirt", "jmp", "newobj"}));
}

TEST(OpCodeTable, ShortInlineIIsUsedByThreeOpcodes)
{
    std::set<std::string> users;
    for (const auto &op : OpCodeTable::standard().entries())
        if (op.operandType == OperandType::ShortInlineI)
            users.insert(op.name);
    EXPECT_EQ(users, (std::set<std::string>{"ldc.i4.s", "no.", "unaligned."}));
}

TEST(OpCodeTable, SyntheticTableResolvesItsOwnEntries)
{
    auto table = OpCodeTable::create({
        {Code::Nop, "nop", OperandType::InlineNone, FlowControl::Next, OpCodeType::Primitive,
         StackPush::Push0, StackPop::Pop0},
        {Code::Ceq, "ceq", OperandType::InlineNone, FlowControl::Next, OpCodeType::Primitive,
         StackPush::Pushi, StackPop::Pop1_pop1},
    });
    ASSERT_TRUE(table);
    EXPECT_EQ(table.value().size(), 2u);
    ASSERT_NE(table.value().find(Code::Ceq), nullptr);
    EXPECT_STREQ(table.value().find(Code::Ceq)->name, "ceq");
    EXPECT_EQ(table.value().find(Code::Ret), nullptr);
}

TEST(OpCodeTable, SyntheticTableRejectsDuplicates)
{
    auto dupCode = OpCodeTable::create({
        {Code::Nop, "nop", OperandType::InlineNone, FlowControl::Next, OpCodeType::Primitive,
         StackPush::Push0, StackPop::Pop0},
        {Code::Nop, "nop2", OperandType::InlineNone, FlowControl::Next, OpCodeType::Primitive,
         StackPush::Push0, StackPop::Pop0},
    });
    ASSERT_FALSE(dupCode);
    EXPECT_TRUE(hasInstrDiagCode(dupCode.error(), InstrDiagCode::DuplicateOpCode));
    EXPECT_NE(dupCode.error().message.find("0x0000"), std::string::npos);

    auto dupName = OpCodeTable::create({
        {Code::Nop, "x", OperandType::InlineNone, FlowControl::Next, OpCodeType::Primitive,
         StackPush::Push0, StackPop::Pop0},
        {Code::Break, "x", OperandType::InlineNone, FlowControl::Break, OpCodeType::Primitive,
         StackPush::Push0, StackPop::Pop0},
    });
    ASSERT_FALSE(dupName);
    EXPECT_TRUE(hasInstrDiagCode(dupName.error(), InstrDiagCode::DuplicateOpCode));
    EXPECT_NE(dupName.error().message.find("'x'"), std::string::npos);
}

TEST(OpCodeTable, SyntheticTableRejectsUnencodableValues)
{
    auto table = OpCodeTable::create({
        {static_cast<Code>(0x1234), "bogus", OperandType::InlineNone, FlowControl::Next,
         OpCodeType::Primitive, StackPush::Push0, StackPop::Pop0},
    });
    ASSERT_FALSE(table);
    EXPECT_TRUE(hasInstrDiagCode(table.error(), InstrDiagCode::InvalidOpCodeValue));
    EXPECT_NE(table.error().message.find("0x1234"), std::string::npos);
}

TEST(OpCodeTable, SyntheticTableRejectsBareEscapeByte)
{
    auto table = OpCodeTable::create({
        {static_cast<Code>(0x00FE), "fake", OperandType::InlineNone, FlowControl::Next,
         OpCodeType::Primitive, StackPush::Push0, StackPop::Pop0},
    });
    ASSERT_FALSE(table);
    EXPECT_TRUE(hasInstrDiagCode(table.error(), InstrDiagCode::InvalidOpCodeValue));
    EXPECT_NE(table.error().message.find("0x00FE"), std::string::npos);

    auto prefixed = OpCodeTable::create({
        {static_cast<Code>(0xFE00), "arglist", OperandType::InlineNone, FlowControl::Next,
         OpCodeType::Primitive, StackPush::Pushi, StackPop::Pop0},
    });
    ASSERT_TRUE(prefixed);
    ASSERT_NE(prefixed.value().find(static_cast<Code>(0xFE00)), nullptr);
    EXPECT_EQ(prefixed.value().find(static_cast<Code>(0x00FE)), nullptr);
}

TEST(OpCodeTable, EnumNamesAreStable)
{
    EXPECT_EQ(toString(OperandType::ShortInlineBrTarget), "ShortInlineBrTarget");
    EXPECT_EQ(toString(OperandType::InlineSwitch), "InlineSwitch");
    EXPECT_EQ(toString(FlowControl::CondBranch), "CondBranch");
    EXPECT_EQ(toString(StackPush::Push1_push1), "Push1_push1");
    EXPECT_EQ(toString(StackPop::Popref_popi_popref), "Popref_popi_popref");
    EXPECT_EQ(toString(StackPop::PopAll), "PopAll");
}
