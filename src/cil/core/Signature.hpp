//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cil/core/Signature.hpp
// Purpose: Declares the slice of ECMA-335 signatures the stack analysis reads.
// Key invariants: Calling-convention flags follow ECMA-335 II.23.2.1.
// Ownership/Lifetime: Signatures own their parameter lists by value.
// Links: ECMA-335 Partition II §23.2
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <vector>

namespace cil::core
{

class TypeDefOrRef;

/// @brief Element type tags (ECMA-335 II.23.1.16).
enum class ElementType : uint8_t
{
    End = 0x00,
    Void = 0x01,
    Boolean = 0x02,
    Char = 0x03,
    I1 = 0x04,
    U1 = 0x05,
    I2 = 0x06,
    U2 = 0x07,
    I4 = 0x08,
    U4 = 0x09,
    I8 = 0x0A,
    U8 = 0x0B,
    R4 = 0x0C,
    R8 = 0x0D,
    String = 0x0E,
    Ptr = 0x0F,
    ByRef = 0x10,
    ValueType = 0x11,
    Class = 0x12,
    Var = 0x13,
    Array = 0x14,
    GenericInst = 0x15,
    TypedByRef = 0x16,
    I = 0x18,
    U = 0x19,
    FnPtr = 0x1B,
    Object = 0x1C,
    SZArray = 0x1D,
    MVar = 0x1E
};

/// @brief A type as it appears inside a signature.
/// @details Only the leading element type is modelled; class and value types
///          may reference their definition through @ref type.
struct TypeSig
{
    ElementType elementType = ElementType::End;
    const TypeDefOrRef *type = nullptr;

    [[nodiscard]] bool isVoid() const
    {
        return elementType == ElementType::Void;
    }
};

/// @brief Calling-convention byte of a method signature.
enum class CallingConvention : uint8_t
{
    Default = 0x00,
    C = 0x01,
    StdCall = 0x02,
    ThisCall = 0x03,
    FastCall = 0x04,
    VarArg = 0x05,
    Unmanaged = 0x09,
    NativeVarArg = 0x0B,
    Mask = 0x0F,
    Generic = 0x10,
    HasThis = 0x20,
    ExplicitThis = 0x40
};

constexpr CallingConvention operator|(CallingConvention a, CallingConvention b)
{
    return static_cast<CallingConvention>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr bool hasFlag(CallingConvention value, CallingConvention flag)
{
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/// @brief Method or stand-alone call signature.
struct MethodSig
{
    CallingConvention callingConvention = CallingConvention::Default;
    TypeSig retType{ElementType::Void};
    std::vector<TypeSig> params;

    /// @brief Signature declares a receiver.
    [[nodiscard]] bool hasThis() const
    {
        return hasFlag(callingConvention, CallingConvention::HasThis);
    }

    /// @brief Receiver appears as the first entry of @ref params.
    [[nodiscard]] bool explicitThis() const
    {
        return hasFlag(callingConvention, CallingConvention::ExplicitThis);
    }

    /// @brief Receiver is passed but not listed among @ref params.
    [[nodiscard]] bool implicitThis() const
    {
        return hasThis() && !explicitThis();
    }
};

} // namespace cil::core
