// gql_coerce/coerce/normalizer.cpp - AST / JSON to RawValue translation
#include "gql_coerce/coerce/normalizer.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "gql_coerce/basic/casting.hpp"

namespace gql_coerce
{

RawValue Normalizer::normalize(const ValueNode * node)
{
  if (node == nullptr) return RawValue::make_absent();

  switch (node->get_kind()) {
    case NodeKind::IntValue:
      return RawValue::make_int(cast<IntValueNode>(node)->value);
    case NodeKind::FloatValue:
      return RawValue::make_float(cast<FloatValueNode>(node)->value);
    case NodeKind::StringValue:
      return RawValue::make_string(cast<StringValueNode>(node)->value);
    case NodeKind::BooleanValue:
      return RawValue::make_boolean(cast<BooleanValueNode>(node)->value);
    case NodeKind::NullValue:
      return RawValue::make_null();
    case NodeKind::EnumValue:
      return RawValue::make_enum(cast<EnumValueNode>(node)->name);
    case NodeKind::Variable:
      return RawValue::make_variable(cast<VariableNode>(node)->name);

    case NodeKind::ListValue: {
      const auto * list = cast<ListValueNode>(node);
      auto elems = arena_.allocate_array<RawValue>(list->elements.size());
      for (size_t i = 0; i < list->elements.size(); ++i) {
        elems[i] = normalize(list->elements[i]);
      }
      return RawValue::make_list(elems);
    }

    case NodeKind::ObjectValue: {
      const auto * obj = cast<ObjectValueNode>(node);
      auto fields = arena_.allocate_array<RawField>(obj->fields.size());
      for (size_t i = 0; i < obj->fields.size(); ++i) {
        fields[i].name = obj->fields[i]->name;
        fields[i].value = normalize(obj->fields[i]->value);
      }
      return RawValue::make_object(fields);
    }

    default:
      break;
  }

  // Only value kinds reach here through ValueNode; anything else is treated
  // as not supplied.
  return RawValue::make_absent();
}

RawValue Normalizer::from_json(const nlohmann::json & json)
{
  switch (json.type()) {
    case nlohmann::json::value_t::null:
      return RawValue::make_null();
    case nlohmann::json::value_t::boolean:
      return RawValue::make_boolean(json.get<bool>());
    case nlohmann::json::value_t::number_integer:
      return RawValue::make_int(json.get<int64_t>());
    case nlohmann::json::value_t::number_unsigned: {
      const auto u = json.get<uint64_t>();
      if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return RawValue::make_float(static_cast<double>(u));
      }
      return RawValue::make_int(static_cast<int64_t>(u));
    }
    case nlohmann::json::value_t::number_float:
      return RawValue::make_float(json.get<double>());
    case nlohmann::json::value_t::string:
      return RawValue::make_string(arena_.intern(json.get_ref<const std::string &>()));

    case nlohmann::json::value_t::array: {
      auto elems = arena_.allocate_array<RawValue>(json.size());
      size_t i = 0;
      for (const auto & elem : json) {
        elems[i++] = from_json(elem);
      }
      return RawValue::make_list(elems);
    }

    case nlohmann::json::value_t::object: {
      auto fields = arena_.allocate_array<RawField>(json.size());
      size_t i = 0;
      for (const auto & item : json.items()) {
        fields[i].name = arena_.intern(item.key());
        fields[i].value = from_json(item.value());
        ++i;
      }
      return RawValue::make_object(fields);
    }

    case nlohmann::json::value_t::binary:
    case nlohmann::json::value_t::discarded:
      break;
  }
  return RawValue::make_absent();
}

}  // namespace gql_coerce
