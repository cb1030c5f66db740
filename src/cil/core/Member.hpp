//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the metadata entities an instruction may reference:
// types, fields, methods, parameters and locals. The instruction core treats
// them as opaque payloads observed through non-owning pointers; the only
// property it ever reads is the signature of a method.
//
// The abstract bases let a metadata reader plug in its own row objects. The
// small concrete classes (TypeRef, FieldRef, MethodRef) serve tools and tests
// that build instructions without a full metadata model.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cil/core/Signature.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace cil::core
{

/// @brief Anything that can be encoded as a metadata token.
class TokenOperand
{
  public:
    virtual ~TokenOperand() = default;

    /// @brief Metadata token (table in the high byte, row in the low 24 bits).
    [[nodiscard]] virtual uint32_t token() const = 0;

    /// @brief Display name used in diagnostics.
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// @brief TypeDef, TypeRef or TypeSpec.
class TypeDefOrRef : public TokenOperand
{
};

/// @brief FieldDef or field MemberRef.
class Field : public TokenOperand
{
};

/// @brief MethodDef, method MemberRef or MethodSpec.
class Method : public TokenOperand
{
  public:
    /// @brief Signature of the method; null when it could not be resolved.
    [[nodiscard]] virtual const MethodSig *methodSig() const = 0;
};

/// @brief Named type reference.
class TypeRef final : public TypeDefOrRef
{
  public:
    TypeRef(uint32_t token, std::string name) : token_(token), name_(std::move(name)) {}

    uint32_t token() const override
    {
        return token_;
    }

    std::string_view name() const override
    {
        return name_;
    }

  private:
    uint32_t token_;
    std::string name_;
};

/// @brief Named field reference.
class FieldRef final : public Field
{
  public:
    FieldRef(uint32_t token, std::string name) : token_(token), name_(std::move(name)) {}

    uint32_t token() const override
    {
        return token_;
    }

    std::string_view name() const override
    {
        return name_;
    }

  private:
    uint32_t token_;
    std::string name_;
};

/// @brief Method reference owning its signature.
class MethodRef final : public Method
{
  public:
    MethodRef(uint32_t token, std::string name, MethodSig sig)
        : token_(token), name_(std::move(name)), sig_(std::move(sig))
    {
    }

    uint32_t token() const override
    {
        return token_;
    }

    std::string_view name() const override
    {
        return name_;
    }

    const MethodSig *methodSig() const override
    {
        return &sig_;
    }

  private:
    uint32_t token_;
    std::string name_;
    MethodSig sig_;
};

/// @brief Method argument addressed by ldarg/starg and friends.
struct Parameter
{
    uint16_t index = 0;
    std::string name;
    TypeSig type;
};

/// @brief Method local addressed by ldloc/stloc and friends.
struct Local
{
    uint16_t index = 0;
    std::string name;
    TypeSig type;
};

} // namespace cil::core
