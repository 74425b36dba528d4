// gql_coerce/schema/type.cpp - Type context implementation
//
#include "gql_coerce/schema/type.hpp"

#include "gql_coerce/schema/builtin_scalars.hpp"

namespace gql_coerce
{

namespace
{

Type make_builtin(std::string name, ScalarParseFn parse, ScalarSerializeFn serialize)
{
  Type t{TypeKind::Scalar};
  t.name = std::move(name);
  t.parse = std::move(parse);
  t.serialize = std::move(serialize);
  return t;
}

}  // namespace

std::string Type::display_name() const
{
  switch (kind) {
    case TypeKind::List:
      return "[" + of_type->display_name() + "]";
    case TypeKind::NonNull:
      return of_type->display_name() + "!";
    case TypeKind::Scalar:
    case TypeKind::Enum:
    case TypeKind::InputObject:
      return name;
  }
  return name;
}

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext()
: int_(make_builtin("Int", builtin::parse_int, builtin::serialize_int)),
  float_(make_builtin("Float", builtin::parse_float, builtin::serialize_float)),
  string_(make_builtin("String", builtin::parse_string, builtin::serialize_string)),
  boolean_(make_builtin("Boolean", builtin::parse_boolean, builtin::serialize_boolean)),
  id_(make_builtin("ID", builtin::parse_id, builtin::serialize_id))
{
}

const Type * TypeContext::define_scalar(
  std::string name, ScalarParseFn parse, ScalarSerializeFn serialize)
{
  named_types_.push_back(make_builtin(std::move(name), std::move(parse), std::move(serialize)));
  return &named_types_.back();
}

const Type * TypeContext::define_enum(std::string name, std::vector<std::string> values)
{
  Type new_type{TypeKind::Enum};
  new_type.name = std::move(name);
  new_type.enum_values = std::move(values);
  named_types_.push_back(std::move(new_type));
  return &named_types_.back();
}

Type * TypeContext::define_input_object(std::string name, std::vector<InputField> fields)
{
  Type new_type{TypeKind::InputObject};
  new_type.name = std::move(name);
  new_type.fields = std::move(fields);
  named_types_.push_back(std::move(new_type));
  return &named_types_.back();
}

// ============================================================================
// WrapperTypeTable Implementation
// ============================================================================

const Type * WrapperTypeTable::list_of(const Type * of_type)
{
  return intern(TypeKind::List, of_type);
}

const Type * WrapperTypeTable::non_null_of(const Type * of_type)
{
  // Don't double-wrap non-null
  if (of_type->is_non_null()) {
    return of_type;
  }
  return intern(TypeKind::NonNull, of_type);
}

const Type * WrapperTypeTable::intern(TypeKind kind, const Type * of_type)
{
  for (const auto & t : types_) {
    if (t.kind == kind && t.of_type == of_type) {
      return &t;
    }
  }

  Type new_type{kind};
  new_type.of_type = of_type;
  types_.push_back(std::move(new_type));
  return &types_.back();
}

const Type * TypeContext::lookup(std::string_view name) const
{
  if (name == "Int") return &int_;
  if (name == "Float") return &float_;
  if (name == "String") return &string_;
  if (name == "Boolean") return &boolean_;
  if (name == "ID") return &id_;

  for (const auto & t : named_types_) {
    if (t.name == name) return &t;
  }
  return nullptr;
}

}  // namespace gql_coerce
