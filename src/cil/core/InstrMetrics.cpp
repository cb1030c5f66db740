//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the encoded-size and stack-effect calculations.
//
// The size table reproduces the ECMA-335 operand encodings exactly; encoders
// and branch-displacement calculators depend on it byte for byte.
//
// The stack effect takes one of two paths. Opcodes whose flow control is Call
// (call, callvirt, calli, newobj, jmp) compute it from the callee signature:
//   pushes = 1 if the return type is not void, or for newobj when the
//            signature has a receiver (the new object is pushed even though the
//            constructor returns void);
//   pops   = declared parameters, plus the implicit receiver except for newobj,
//            plus the function pointer for calli.
// A call whose operand carries no signature degrades to {0, 0} so analysis
// can keep going over partially resolved metadata. Every other opcode maps
// its static push and pop classes to counts; Varpop (used by `ret`) pops one
// value only when the enclosing method returns one.
//
//===----------------------------------------------------------------------===//

#include "cil/core/InstrMetrics.hpp"
#include "cil/support/trace.hpp"

#include <string>

namespace cil::core
{

namespace
{
/// @brief Signature of the method operand of a call-family instruction, or null.
const MethodSig *resolveCallSignature(const Instruction &instr)
{
    switch (instr.operandKind())
    {
        case OperandKind::Method:
        {
            const Method *method = instr.method();
            return method ? method->methodSig() : nullptr;
        }
        case OperandKind::None:
        case OperandKind::U8:
        case OperandKind::I8:
        case OperandKind::I32:
        case OperandKind::I64:
        case OperandKind::R4:
        case OperandKind::R8:
        case OperandKind::String:
        case OperandKind::Target:
        case OperandKind::Targets:
        case OperandKind::Type:
        case OperandKind::Field:
        case OperandKind::Token:
        case OperandKind::Sig:
        case OperandKind::Param:
        case OperandKind::Local:
        case OperandKind::Count:
            return nullptr;
    }
    return nullptr;
}

StackEffect callStackEffect(const Instruction &instr)
{
    StackEffect effect;
    const OpCode &op = instr.opCode();
    const MethodSig *sig = resolveCallSignature(instr);
    if (!sig)
    {
        if (cil::support::isTraceEnabled())
        {
            cil::support::trace("stack",
                                std::string("'") + op.name + "' at offset " +
                                    std::to_string(instr.offset()) +
                                    " has no resolvable signature; reporting 0/0");
        }
        return effect;
    }

    const bool isNewobj = op.code == Code::Newobj;
    if (!sig->retType.isVoid() || (isNewobj && sig->hasThis()))
        ++effect.pushes;

    effect.pops += static_cast<int>(sig->params.size());
    if (sig->implicitThis() && !isNewobj)
        ++effect.pops;
    if (op.code == Code::Calli)
        ++effect.pops;
    return effect;
}

int pushCount(StackPush push)
{
    switch (push)
    {
        case StackPush::Push0:
            return 0;
        case StackPush::Push1:
        case StackPush::Pushi:
        case StackPush::Pushi8:
        case StackPush::Pushr4:
        case StackPush::Pushr8:
        case StackPush::Pushref:
            return 1;
        case StackPush::Push1_push1:
            return 2;
        case StackPush::Varpush: // call-family only; handled by callStackEffect
            return 0;
    }
    return 0;
}

int popCount(StackPop pop, bool methodHasReturnValue)
{
    switch (pop)
    {
        case StackPop::Pop0:
            return 0;
        case StackPop::Pop1:
        case StackPop::Popi:
        case StackPop::Popref:
            return 1;
        case StackPop::Pop1_pop1:
        case StackPop::Popi_pop1:
        case StackPop::Popi_popi:
        case StackPop::Popi_popi8:
        case StackPop::Popi_popr4:
        case StackPop::Popi_popr8:
        case StackPop::Popref_pop1:
        case StackPop::Popref_popi:
            return 2;
        case StackPop::Popi_popi_popi:
        case StackPop::Popref_popi_popi:
        case StackPop::Popref_popi_popi8:
        case StackPop::Popref_popi_popr4:
        case StackPop::Popref_popi_popr8:
        case StackPop::Popref_popi_popref:
        case StackPop::Popref_popi_pop1:
            return 3;
        case StackPop::PopAll:
            return StackEffect::kPopAll;
        case StackPop::Varpop:
            return methodHasReturnValue ? 1 : 0;
    }
    return 0;
}
} // namespace

std::ostream &operator<<(std::ostream &os, const StackEffect &effect)
{
    os << effect.pushes << '/';
    if (effect.clearsStack())
        return os << "all";
    return os << effect.pops;
}

uint32_t encodedSize(const Instruction &instr)
{
    const OpCode &op = instr.opCode();
    switch (op.operandType)
    {
        case OperandType::InlineBrTarget:
        case OperandType::InlineField:
        case OperandType::InlineI:
        case OperandType::InlineMethod:
        case OperandType::InlineSig:
        case OperandType::InlineString:
        case OperandType::InlineTok:
        case OperandType::InlineType:
        case OperandType::ShortInlineR:
            return op.size() + 4;

        case OperandType::InlineI8:
        case OperandType::InlineR:
            return op.size() + 8;

        case OperandType::InlineNone:
        case OperandType::InlinePhi:
            return op.size();

        case OperandType::InlineSwitch:
        {
            const TargetList *targets = instr.targets();
            const auto count = targets ? static_cast<uint32_t>(targets->size()) : 0u;
            return op.size() + 4 + count * 4;
        }

        case OperandType::InlineVar:
            return op.size() + 2;

        case OperandType::ShortInlineBrTarget:
        case OperandType::ShortInlineI:
        case OperandType::ShortInlineVar:
            return op.size() + 1;
    }
    return op.size();
}

StackEffect stackEffect(const Instruction &instr, bool methodHasReturnValue)
{
    const OpCode &op = instr.opCode();
    if (op.flowControl == FlowControl::Call)
        return callStackEffect(instr);
    return StackEffect{pushCount(op.push), popCount(op.pop, methodHasReturnValue)};
}

} // namespace cil::core
