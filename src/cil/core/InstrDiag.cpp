//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Translates instruction diagnostic codes into their textual prefixes and
// builds error diagnostics tagged with them.
//
//===----------------------------------------------------------------------===//

#include "cil/core/InstrDiag.hpp"

#include <utility>

namespace cil::core
{

std::string_view toString(InstrDiagCode code)
{
    switch (code)
    {
        case InstrDiagCode::Unknown:
            return {};
        case InstrDiagCode::InvalidOperand:
            return "instr.invalid_operand";
        case InstrDiagCode::DuplicateOpCode:
            return "instr.duplicate_opcode";
        case InstrDiagCode::InvalidOpCodeValue:
            return "instr.invalid_opcode_value";
    }
    return {};
}

/// @brief Prepend the code prefix (when available) to @p message.
cil::support::Diag makeInstrError(InstrDiagCode code, std::string message)
{
    const std::string_view prefix = toString(code);
    if (!prefix.empty())
    {
        if (!message.empty())
        {
            message.insert(0, ": ");
            message.insert(0, prefix);
        }
        else
        {
            message.assign(prefix);
        }
    }
    return cil::support::makeError(std::move(message));
}

bool hasInstrDiagCode(const cil::support::Diag &diag, InstrDiagCode code)
{
    const std::string_view prefix = toString(code);
    if (prefix.empty())
        return false;
    const std::string_view msg = diag.message;
    if (msg.substr(0, prefix.size()) != prefix)
        return false;
    return msg.size() == prefix.size() || msg[prefix.size()] == ':';
}

} // namespace cil::core
