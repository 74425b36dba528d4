// gql_coerce/coerce/variable_resolver.cpp - Request variable resolution
#include "gql_coerce/coerce/variable_resolver.hpp"

#include <fmt/core.h>

#include <string>
#include <utility>

#include "gql_coerce/coerce/argument_coercer.hpp"

namespace gql_coerce
{

VariableResolver::VariableResolver(
  std::vector<VariableDefinition> definitions, nlohmann::json supplied)
: definitions_(std::move(definitions)), supplied_(std::move(supplied))
{
  if (!supplied_.is_object()) {
    supplied_ = nlohmann::json::object();
  }
}

const VariableDefinition * VariableResolver::find_definition(std::string_view name) const noexcept
{
  for (const auto & def : definitions_) {
    if (def.name == name) return &def;
  }
  return nullptr;
}

Value VariableResolver::resolve(
  std::string_view name, const Type * expected, const ArgumentPath & path,
  ArgumentCoercer & coercer) const
{
  const VariableDefinition * def = find_definition(name);

  if (def != nullptr && def->type == nullptr) {
    coercer.failures().report(
      FailureKind::UnknownType, path,
      fmt::format("variable `${}' has unknown type `{}'", name, def->type_name));
    return Value::make_absent();
  }

  // An undeclared reference takes the type of its position.
  const Type * declared = def != nullptr ? def->type : expected;

  const auto it = supplied_.find(std::string(name));
  if (it == supplied_.end()) {
    if (def != nullptr && def->default_value != nullptr) {
      const RawValue raw = coercer.normalizer().normalize(def->default_value);
      return coercer.coerce(expected, raw, path, CoercionSource::Constant);
    }
    if (declared->is_non_null()) {
      coercer.failures().report(
        FailureKind::MissingRequiredVariable, path,
        fmt::format(
          "variable `${}' of required type `{}' was not provided", name,
          declared->display_name()));
    }
    return Value::make_absent();
  }

  if (it->is_null() && declared->is_non_null()) {
    coercer.failures().report(
      FailureKind::ValueRequired, path,
      fmt::format(
        "variable `${}' of required type `{}' must not be null", name, declared->display_name()));
    return Value::make_absent();
  }

  const RawValue raw = coercer.normalizer().from_json(*it);
  return coercer.coerce(expected, raw, path, CoercionSource::Variable);
}

}  // namespace gql_coerce
