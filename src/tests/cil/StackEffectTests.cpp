//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/cil/StackEffectTests.cpp
// Purpose: Verify push/pop counts for static stack classes and call signatures.
// Key invariants: Call-family opcodes without a resolvable signature report
//                 {0, 0}; PopAll reports the -1 sentinel.
// Ownership/Lifetime: Signatures and members live on the test stack.
// Links: src/cil/core/InstrMetrics.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "cil/core/InstrMetrics.hpp"
#include "cil/core/OpCodeTable.hpp"

#include <sstream>
#include <string>

using namespace cil::core;

namespace
{
/// Method whose signature could not be resolved by the metadata reader.
class UnresolvedMethod final : public Method
{
  public:
    uint32_t token() const override
    {
        return 0x0A0000FF;
    }

    std::string_view name() const override
    {
        return "Missing";
    }

    const MethodSig *methodSig() const override
    {
        return nullptr;
    }
};

StackEffect effectOf(Code code, bool methodHasReturnValue = false)
{
    return stackEffect(Instruction::createUnchecked(opCode(code)), methodHasReturnValue);
}

StackEffect callEffect(Code code, const Method &method)
{
    return stackEffect(Instruction::createMethod(opCode(code), method).value());
}

MethodSig makeSig(CallingConvention cc, ElementType ret, size_t paramCount)
{
    MethodSig sig;
    sig.callingConvention = cc;
    sig.retType = TypeSig{ret};
    sig.params.assign(paramCount, TypeSig{ElementType::I4});
    return sig;
}
} // namespace

TEST(StackEffect, DupPushesTwo)
{
    EXPECT_EQ(effectOf(Code::Dup), (StackEffect{2, 1}));
}

TEST(StackEffect, RetDependsOnMethodReturnValue)
{
    EXPECT_EQ(effectOf(Code::Ret, true), (StackEffect{0, 1}));
    EXPECT_EQ(effectOf(Code::Ret, false), (StackEffect{0, 0}));
    EXPECT_EQ(effectOf(Code::Ret), (StackEffect{0, 0}));
}

TEST(StackEffect, StaticClassesMapToCounts)
{
    EXPECT_EQ(effectOf(Code::Nop), (StackEffect{0, 0}));
    EXPECT_EQ(effectOf(Code::Ldnull), (StackEffect{1, 0}));
    EXPECT_EQ(effectOf(Code::Ldc_I8), (StackEffect{1, 0}));
    EXPECT_EQ(effectOf(Code::Ldc_R4), (StackEffect{1, 0}));
    EXPECT_EQ(effectOf(Code::Stloc_0), (StackEffect{0, 1}));
    EXPECT_EQ(effectOf(Code::Brtrue_S), (StackEffect{0, 1}));
    EXPECT_EQ(effectOf(Code::Throw), (StackEffect{0, 1}));
    EXPECT_EQ(effectOf(Code::Add), (StackEffect{1, 2}));
    EXPECT_EQ(effectOf(Code::Stfld), (StackEffect{0, 2}));
    EXPECT_EQ(effectOf(Code::Stind_R8), (StackEffect{0, 2}));
    EXPECT_EQ(effectOf(Code::Ldelem_Ref), (StackEffect{1, 2}));
    EXPECT_EQ(effectOf(Code::Stelem_Ref), (StackEffect{0, 3}));
    EXPECT_EQ(effectOf(Code::Stelem), (StackEffect{0, 3}));
    EXPECT_EQ(effectOf(Code::Cpblk), (StackEffect{0, 3}));
    EXPECT_EQ(effectOf(Code::Ceq), (StackEffect{1, 2}));
}

TEST(StackEffect, LeaveAndEndfinallyClearTheStack)
{
    for (const Code code : {Code::Leave, Code::Leave_S, Code::Endfinally})
    {
        const StackEffect effect = effectOf(code);
        EXPECT_EQ(effect.pushes, 0);
        EXPECT_EQ(effect.pops, StackEffect::kPopAll);
        EXPECT_TRUE(effect.clearsStack());
    }
    EXPECT_FALSE(effectOf(Code::Pop).clearsStack());
}

TEST(StackEffect, NonCallOpcodesStayWithinStaticBounds)
{
    for (const auto &op : OpCodeTable::standard().entries())
    {
        if (op.flowControl == FlowControl::Call)
            continue;
        const StackEffect effect = effectOf(op.code, true);
        EXPECT_GE(effect.pushes, 0) << op.name;
        EXPECT_LE(effect.pushes, op.code == Code::Dup ? 2 : 1) << op.name;
        EXPECT_GE(effect.pops, StackEffect::kPopAll) << op.name;
        EXPECT_LE(effect.pops, 3) << op.name;
        if (op.pop != StackPop::Varpop)
            EXPECT_EQ(effect, effectOf(op.code, false)) << op.name;
    }
}

TEST(StackEffect, InstanceCallPopsReceiverAndArguments)
{
    const MethodRef method(0x0A000001, "Compare", makeSig(CallingConvention::HasThis, ElementType::I4, 2));
    EXPECT_EQ(callEffect(Code::Call, method), (StackEffect{1, 3}));
    EXPECT_EQ(callEffect(Code::Callvirt, method), (StackEffect{1, 3}));
}

TEST(StackEffect, VoidStaticCallPushesNothing)
{
    const MethodRef method(0x0A000002, "Log", makeSig(CallingConvention::Default, ElementType::Void, 1));
    EXPECT_EQ(callEffect(Code::Call, method), (StackEffect{0, 1}));
}

TEST(StackEffect, NewobjPushesInstanceWithoutPoppingReceiver)
{
    const MethodRef ctor(0x0A000003, ".ctor", makeSig(CallingConvention::HasThis, ElementType::Void, 1));
    EXPECT_EQ(callEffect(Code::Newobj, ctor), (StackEffect{1, 1}));

    // The same constructor invoked through `call` (base-constructor chaining)
    // pops the receiver and pushes nothing.
    EXPECT_EQ(callEffect(Code::Call, ctor), (StackEffect{0, 2}));
}

TEST(StackEffect, NewobjCarveOutRequiresReceiver)
{
    const MethodRef staticVoid(0x0A000004, "Odd", makeSig(CallingConvention::Default, ElementType::Void, 2));
    EXPECT_EQ(callEffect(Code::Newobj, staticVoid), (StackEffect{0, 2}));
}

TEST(StackEffect, ExplicitThisIsCountedAmongParameters)
{
    const MethodRef method(0x0A000005,
                           "Explicit",
                           makeSig(CallingConvention::HasThis | CallingConvention::ExplicitThis,
                                   ElementType::Void,
                                   2));
    EXPECT_EQ(callEffect(Code::Call, method), (StackEffect{0, 2}));
    EXPECT_EQ(callEffect(Code::Newobj, method), (StackEffect{1, 2}));
}

TEST(StackEffect, CalliPopsTheFunctionPointer)
{
    const MethodRef direct(0x0A000006, "Direct", makeSig(CallingConvention::Default, ElementType::R8, 2));

    const StackEffect viaCall = callEffect(Code::Call, direct);
    const Instruction calli =
        Instruction::createUnchecked(opCode(Code::Calli), static_cast<const Method *>(&direct));
    const StackEffect viaCalli = stackEffect(calli);
    EXPECT_EQ(viaCall, (StackEffect{1, 2}));
    EXPECT_EQ(viaCalli.pushes, viaCall.pushes);
    EXPECT_EQ(viaCalli.pops, viaCall.pops + 1);

    const MethodRef instance(0x0A000009, "Instance", makeSig(CallingConvention::HasThis, ElementType::Void, 1));
    const Instruction instanceCalli =
        Instruction::createUnchecked(opCode(Code::Calli), static_cast<const Method *>(&instance));
    EXPECT_EQ(stackEffect(instanceCalli), (StackEffect{0, 3}));
}

TEST(StackEffect, ReturnTypeWithoutElementTypeCountsAsValue)
{
    MethodSig sig = makeSig(CallingConvention::Default, ElementType::End, 0);
    const MethodRef method(0x0A000007, "Unknown", sig);
    EXPECT_EQ(callEffect(Code::Call, method), (StackEffect{1, 0}));
}

TEST(StackEffect, UnresolvedCallsDegradeToZero)
{
    const UnresolvedMethod missing;
    EXPECT_EQ(callEffect(Code::Call, missing), (StackEffect{0, 0}));
    EXPECT_EQ(callEffect(Code::Newobj, missing), (StackEffect{0, 0}));

    // A standalone signature is not a method reference.
    const MethodSig sig = makeSig(CallingConvention::Default, ElementType::I4, 2);
    const Instruction calliSig = Instruction::createSig(opCode(Code::Calli), sig).value();
    EXPECT_EQ(stackEffect(calliSig), (StackEffect{0, 0}));
    EXPECT_EQ(stackEffect(calliSig, true), (StackEffect{0, 0}));

    const TypeRef type(0x01000010, "System.String");
    for (const Code code : {Code::Call, Code::Callvirt, Code::Calli, Code::Newobj, Code::Jmp})
    {
        EXPECT_EQ(effectOf(code), (StackEffect{0, 0}));
        EXPECT_EQ(effectOf(code, true), (StackEffect{0, 0}));
        const Instruction wrong =
            Instruction::createUnchecked(opCode(code), static_cast<const TypeDefOrRef *>(&type));
        EXPECT_EQ(stackEffect(wrong), (StackEffect{0, 0}));
        const Instruction number = Instruction::createUnchecked(opCode(code), int32_t{5});
        EXPECT_EQ(stackEffect(number), (StackEffect{0, 0}));
    }
}

TEST(StackEffect, MethodReturnFlagDoesNotAffectCalls)
{
    const MethodRef method(0x0A000008, "Get", makeSig(CallingConvention::HasThis, ElementType::Object, 0));
    const Instruction call = Instruction::createMethod(opCode(Code::Callvirt), method).value();
    EXPECT_EQ(stackEffect(call, true), stackEffect(call, false));
}

TEST(StackEffect, PrintsSentinelAsAll)
{
    std::ostringstream os;
    os << StackEffect{0, StackEffect::kPopAll} << ' ' << StackEffect{1, 2};
    EXPECT_EQ(os.str(), "0/all 1/2");
}
