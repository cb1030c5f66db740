//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cil/core/OpCodeTable.hpp
// Purpose: Declares the read-only opcode lookup consumed by the instruction core.
// Key invariants: Codes and mnemonics are unique within a table; every code is
//                 either a one-byte value or carries the 0xFE escape prefix.
// Ownership/Lifetime: A table owns its descriptors; instructions observe them
//                     by pointer, so a table must outlive its instructions.
// Links: ECMA-335 Partition III
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cil/core/OpCode.hpp"
#include "cil/support/diag_expected.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace cil::core
{

/// @brief Immutable lookup of opcode descriptors keyed by encoded value.
/// @details Safe for concurrent reads once constructed.
class OpCodeTable
{
  public:
    /// @brief Access the process-wide table holding every ECMA-335 opcode.
    static const OpCodeTable &standard();

    /// @brief Build a table from caller-supplied descriptors.
    /// @return Table, or an error naming the first duplicate or malformed code.
    static cil::support::Expected<OpCodeTable> create(std::vector<OpCode> entries);

    /// @brief Find the descriptor for @p code; null when absent.
    [[nodiscard]] const OpCode *find(Code code) const;

    /// @brief Find the descriptor whose mnemonic equals @p mnemonic; null when absent.
    [[nodiscard]] const OpCode *findByName(std::string_view mnemonic) const;

    /// @brief Resolve the opcode encoded by @p first (and @p second for 0xFE).
    /// @param first First encoded byte.
    /// @param second Second byte; consulted only when @p first is the escape.
    [[nodiscard]] const OpCode *decode(uint8_t first, uint8_t second = 0) const;

    /// @brief Descriptors in insertion order.
    [[nodiscard]] const std::vector<OpCode> &entries() const
    {
        return entries_;
    }

    [[nodiscard]] size_t size() const
    {
        return entries_.size();
    }

  private:
    static constexpr int16_t kAbsent = -1;

    explicit OpCodeTable(std::vector<OpCode> entries);

    std::vector<OpCode> entries_;
    std::array<int16_t, 256> oneByte_{};
    std::array<int16_t, 256> twoByte_{};
};

/// @brief Descriptor of a standard opcode.
/// @param code Enumerator from @ref Code; always present in the standard table.
const OpCode &opCode(Code code);

} // namespace cil::core
