//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the structured diagnostic codes reported by the
// instruction core. Every failure the core can report is recoverable and is
// returned through support::Expected; the code prefix lets tools filter or
// match diagnostics without parsing free-form text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cil/support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace cil::core
{

/// @brief Identifier for structured instruction-core diagnostics.
enum class InstrDiagCode
{
    Unknown = 0,        ///< Unclassified diagnostic.
    InvalidOperand,     ///< Operand payload does not fit the opcode.
    DuplicateOpCode,    ///< Opcode table lists a code or mnemonic twice.
    InvalidOpCodeValue  ///< Opcode value is neither one-byte nor 0xFE-prefixed.
};

/// @brief Convert a diagnostic code to its textual prefix.
/// @return Stable string such as "instr.invalid_operand"; empty for Unknown.
std::string_view toString(InstrDiagCode code);

/// @brief Construct an error diagnostic tagged with @p code.
/// @details The message is rendered as "<prefix>: <message>".
cil::support::Diag makeInstrError(InstrDiagCode code, std::string message);

/// @brief Check whether @p diag was produced with @p code.
bool hasInstrDiagCode(const cil::support::Diag &diag, InstrDiagCode code);

} // namespace cil::core
