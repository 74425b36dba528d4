// gql_coerce/ast/ast_enums.cpp - NodeKind names
#include "gql_coerce/ast/ast_enums.hpp"

namespace gql_coerce
{

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
    case NodeKind::IntValue:
      return "IntValue";
    case NodeKind::FloatValue:
      return "FloatValue";
    case NodeKind::StringValue:
      return "StringValue";
    case NodeKind::BooleanValue:
      return "BooleanValue";
    case NodeKind::NullValue:
      return "NullValue";
    case NodeKind::EnumValue:
      return "EnumValue";
    case NodeKind::ListValue:
      return "ListValue";
    case NodeKind::ObjectValue:
      return "ObjectValue";
    case NodeKind::Variable:
      return "Variable";
    case NodeKind::NamedType:
      return "NamedType";
    case NodeKind::ListType:
      return "ListType";
    case NodeKind::NonNullType:
      return "NonNullType";
    case NodeKind::ObjectField:
      return "ObjectField";
    case NodeKind::Argument:
      return "Argument";
    case NodeKind::VariableDefinition:
      return "VariableDefinition";
    case NodeKind::Field:
      return "Field";
    case NodeKind::Operation:
      return "Operation";
  }
  return "Unknown";
}

}  // namespace gql_coerce
