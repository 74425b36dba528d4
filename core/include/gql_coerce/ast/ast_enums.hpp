// gql_coerce/ast/ast_enums.hpp - AST node kinds
//
// Node kinds produced by the (external) query parser, grouped by category
// for range-based classof checks.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace gql_coerce
{

enum class NodeKind : uint8_t {
  // === Values ===
  IntValue,
  FloatValue,
  StringValue,
  BooleanValue,
  NullValue,
  EnumValue,
  ListValue,
  ObjectValue,
  Variable,

  // === Type references ===
  NamedType,
  ListType,
  NonNullType,

  // === Supporting nodes ===
  ObjectField,
  Argument,
  VariableDefinition,
  Field,

  // === Top-level ===
  Operation,
};

[[nodiscard]] constexpr bool is_value_kind(NodeKind k) noexcept
{
  return k >= NodeKind::IntValue && k <= NodeKind::Variable;
}

[[nodiscard]] constexpr bool is_type_ref_kind(NodeKind k) noexcept
{
  return k >= NodeKind::NamedType && k <= NodeKind::NonNullType;
}

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

}  // namespace gql_coerce
