//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `cil-opinfo`, a small inspector for the standard opcode table.
// Each argument names an opcode by mnemonic ("ldc.i4.s") or by encoded value
// ("0x1F", "0xFE01"); the tool prints its operand type, flow control, stack
// classes, the encoded size of the instruction with an empty operand, and the
// static stack effect. Unknown opcodes are collected and reported together
// after every known one has been printed.
//
//===----------------------------------------------------------------------===//

#include "tools/cil-opinfo/driver.hpp"

#include "cil/core/InstrMetrics.hpp"
#include "cil/core/Instruction.hpp"
#include "cil/support/diag_expected.hpp"
#include "cil/support/trace.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ostream>
#include <string>
#include <vector>

namespace cil::tools::opinfo
{

namespace
{
constexpr const char *kUsage =
    "Usage: cil-opinfo [--trace] [--has-return] [--version] <mnemonic|0xNN|0xFENN>...\n";

std::string formatCode(cil::core::Code code)
{
    const auto raw = static_cast<unsigned>(code);
    char buf[8];
    if (raw > 0xFF)
        std::snprintf(buf, sizeof(buf), "0x%04X", raw);
    else
        std::snprintf(buf, sizeof(buf), "0x%02X", raw);
    return buf;
}
} // namespace

const cil::core::OpCode *lookupOpCode(const cil::core::OpCodeTable &table,
                                      std::string_view spelling)
{
    if (const auto *op = table.findByName(spelling))
        return op;

    if (spelling.size() < 3 || spelling[0] != '0' || (spelling[1] != 'x' && spelling[1] != 'X'))
        return nullptr;
    const std::string digits(spelling.substr(2));
    if (digits.size() > 4)
        return nullptr;
    for (const char c : digits)
    {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return nullptr;
    }
    const unsigned long raw = std::strtoul(digits.c_str(), nullptr, 16);
    if (raw == cil::core::kTwoByteEscape)
        return nullptr;
    if (raw > 0xFF)
    {
        if ((raw >> 8) != cil::core::kTwoByteEscape)
            return nullptr;
        return table.decode(cil::core::kTwoByteEscape, static_cast<uint8_t>(raw & 0xFF));
    }
    return table.decode(static_cast<uint8_t>(raw));
}

void describeOpCode(const cil::core::OpCode &op,
                    const cil::support::Options &opts,
                    std::ostream &out)
{
    using namespace cil::core;
    const Instruction instr = Instruction::createUnchecked(op);

    out << op.name << " code=" << formatCode(op.code) << " size=" << encodedSize(instr)
        << " operand=" << toString(op.operandType) << " flow=" << toString(op.flowControl)
        << " push=" << toString(op.push) << " pop=" << toString(op.pop) << " effect=";
    if (op.flowControl == FlowControl::Call)
        out << "dynamic";
    else
        out << stackEffect(instr, opts.methodHasReturnValue);
    out << '\n';
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    cil::support::Options opts = cil::support::Options::fromEnvironment();
    std::vector<std::string_view> names;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--version")
        {
            out << "cil-opinfo ECMA-335 6th edition\n";
            return 0;
        }
        if (arg == "--trace")
            opts.trace = true;
        else if (arg == "--has-return")
            opts.methodHasReturnValue = true;
        else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-')
        {
            err << "unknown option '" << arg << "'\n" << kUsage;
            return 1;
        }
        else
            names.push_back(arg);
    }
    if (names.empty())
    {
        err << kUsage;
        return 1;
    }
    cil::support::setTraceEnabled(opts.trace);

    const auto &table = cil::core::OpCodeTable::standard();
    cil::support::DiagnosticEngine diags;
    for (const auto name : names)
    {
        const auto *op = lookupOpCode(table, name);
        if (!op)
        {
            diags.report(cil::support::makeError("unknown opcode '" + std::string(name) + "'"));
            continue;
        }
        cil::support::trace("opinfo", std::string("describing '") + op->name + "'");
        describeOpCode(*op, opts, out);
    }
    diags.printAll(err);
    return diags.errorCount() == 0 ? 0 : 1;
}

} // namespace cil::tools::opinfo
