// gql_coerce/value/value.cpp - Coerced value object entries
#include "gql_coerce/value/value.hpp"

namespace gql_coerce
{

void Value::set(std::string name, Value value)
{
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == name) {
      elements_[i] = std::move(value);
      return;
    }
  }
  keys_.push_back(std::move(name));
  elements_.push_back(std::move(value));
}

const Value * Value::find(std::string_view name) const noexcept
{
  if (!is_object()) return nullptr;
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == name) return &elements_[i];
  }
  return nullptr;
}

}  // namespace gql_coerce
