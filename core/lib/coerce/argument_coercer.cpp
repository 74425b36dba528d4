// gql_coerce/coerce/argument_coercer.cpp - Recursive argument coercion
//
#include "gql_coerce/coerce/argument_coercer.hpp"

#include <fmt/core.h>

#include <string>
#include <utility>
#include <vector>

#include "gql_coerce/coerce/variable_resolver.hpp"
#include "gql_coerce/value/value_printer.hpp"

namespace gql_coerce
{

namespace
{

std::string enum_choices(const Type * type)
{
  std::string out;
  for (size_t i = 0; i < type->enum_values.size(); ++i) {
    if (i != 0) out += ", ";
    out += fmt::format("`{}'", type->enum_values[i]);
  }
  return out;
}

}  // namespace

ArgumentCoercer::ArgumentCoercer(
  AstContext & arena, FailureBag & failures, const VariableResolver * variables,
  CoercionOptions options)
: normalizer_(arena), failures_(failures), variables_(variables), options_(options)
{
}

// ============================================================================
// Entry Points
// ============================================================================

ArgumentMap ArgumentCoercer::coerce_arguments(const FieldDef & field, const FieldNode & node)
{
  ArgumentMap args = Value::make_object();

  for (const auto & arg : field.arguments) {
    const ArgumentNode * arg_node = node.find_argument(arg.name);
    const RawValue raw = normalizer_.normalize(arg_node != nullptr ? arg_node->value : nullptr);

    // A required argument missing from the query text is left for the
    // resolver unless strict mode is on.
    if (
      raw.is_absent() && !arg.default_value && arg.type->is_non_null() &&
      !options_.strict_required_arguments) {
      continue;
    }

    Value value = coerce_position(
      arg.type, raw, arg.default_value, ArgumentPath{arg.name}, CoercionSource::Literal);
    if (!value.is_absent()) {
      args.set(arg.name, std::move(value));
    }
  }

  return args;
}

Value ArgumentCoercer::coerce_position(
  const Type * type, const RawValue & raw, const std::optional<Value> & default_value,
  const ArgumentPath & path, CoercionSource source)
{
  if (raw.is_absent() && default_value) {
    return *default_value;
  }
  if (raw.is_variable() && source == CoercionSource::Literal) {
    return coerce_variable(type, raw.variable_name(), &default_value, path);
  }
  return coerce(type, raw, path, source);
}

Value ArgumentCoercer::coerce(
  const Type * type, const RawValue & raw, const ArgumentPath & path, CoercionSource source)
{
  if (raw.is_variable()) {
    if (source != CoercionSource::Literal) {
      failures_.report(
        FailureKind::ShapeMismatch, path,
        fmt::format("variable `${}' is not allowed in a constant value", raw.variable_name()));
      return Value::make_absent();
    }
    return coerce_variable(type, raw.variable_name(), nullptr, path);
  }

  switch (type->kind) {
    case TypeKind::NonNull:
      if (raw.is_absent()) {
        failures_.report(FailureKind::ValueRequired, path, "no value provided");
        return Value::make_absent();
      }
      if (raw.is_null()) {
        failures_.report(
          FailureKind::ValueRequired, path,
          fmt::format("null is not allowed for type `{}'", type->display_name()));
        return Value::make_absent();
      }
      return coerce(type->of_type, raw, path, source);

    case TypeKind::Scalar:
      return coerce_scalar(type, raw, path);

    case TypeKind::Enum:
      return coerce_enum(type, raw, path, source);

    case TypeKind::List:
      return coerce_list(type, raw, path, source);

    case TypeKind::InputObject:
      return coerce_input_object(type, raw, path, source);
  }

  return Value::make_absent();
}

// ============================================================================
// Variable References
// ============================================================================

Value ArgumentCoercer::coerce_variable(
  const Type * type, std::string_view name, const std::optional<Value> * default_value,
  const ArgumentPath & path)
{
  const size_t failures_before = failures_.size();

  Value value = variables_ != nullptr ? variables_->resolve(name, type, path, *this)
                                      : Value::make_absent();

  if (!value.is_absent() || failures_.size() != failures_before) {
    return value;
  }

  // Unset variable: the position behaves as if nothing was written.
  if (default_value != nullptr && default_value->has_value()) {
    return **default_value;
  }
  if (type->is_non_null()) {
    failures_.report(
      FailureKind::ValueRequired, path,
      fmt::format("no value provided (variable `${}' was not supplied)", name));
  }
  return value;
}

// ============================================================================
// Named Types
// ============================================================================

Value ArgumentCoercer::coerce_scalar(
  const Type * type, const RawValue & raw, const ArgumentPath & path)
{
  if (raw.is_absent()) return Value::make_absent();
  if (raw.is_null()) return Value::make_null();

  ScalarParseResult parsed = type->parse(raw);
  if (!parsed.success) {
    failures_.report(FailureKind::ScalarCoercionFailed, path, std::move(parsed.error));
    return Value::make_absent();
  }
  return Value::make_scalar(std::move(parsed.value));
}

Value ArgumentCoercer::coerce_enum(
  const Type * type, const RawValue & raw, const ArgumentPath & path, CoercionSource source)
{
  if (raw.is_absent()) return Value::make_absent();
  if (raw.is_null()) return Value::make_null();

  // Literal syntax requires a bare symbol; JSON has only strings.
  const bool shape_ok = source == CoercionSource::Variable ? raw.is_string() : raw.is_enum();
  if (shape_ok) {
    const std::string_view symbol = raw.is_string() ? raw.as_string() : raw.enum_name();
    if (type->has_enum_value(symbol)) {
      return Value::make_enum(std::string(symbol));
    }
  }

  failures_.report(
    FailureKind::InvalidEnumValue, path,
    fmt::format(
      "expected one of {} for enum `{}', found {}", enum_choices(type), type->name,
      print_raw(raw)));
  return Value::make_absent();
}

// ============================================================================
// Composite Types
// ============================================================================

Value ArgumentCoercer::coerce_list(
  const Type * type, const RawValue & raw, const ArgumentPath & path, CoercionSource source)
{
  if (raw.is_absent()) return Value::make_absent();
  if (raw.is_null()) return Value::make_null();

  if (!raw.is_list()) {
    failures_.report(
      FailureKind::ShapeMismatch, path,
      fmt::format("expected a list of type `{}', found {}", type->display_name(), print_raw(raw)));
    return Value::make_absent();
  }

  const size_t failures_before = failures_.size();
  std::vector<Value> elements;
  elements.reserve(raw.as_list().size());

  size_t index = 0;
  for (const auto & elem : raw.as_list()) {
    Value coerced = coerce(type->of_type, elem, extend_path(path, index), source);
    // An unset variable inside a list stands for null.
    elements.push_back(coerced.is_absent() ? Value::make_null() : std::move(coerced));
    ++index;
  }

  if (failures_.size() != failures_before) {
    return Value::make_absent();
  }
  return Value::make_list(std::move(elements));
}

Value ArgumentCoercer::coerce_input_object(
  const Type * type, const RawValue & raw, const ArgumentPath & path, CoercionSource source)
{
  if (raw.is_absent()) return Value::make_absent();
  if (raw.is_null()) return Value::make_null();

  if (!raw.is_object()) {
    failures_.report(
      FailureKind::ShapeMismatch, path,
      fmt::format("expected an object of type `{}', found {}", type->name, print_raw(raw)));
    return Value::make_absent();
  }

  const size_t failures_before = failures_.size();
  Value result = Value::make_object();

  // Keys not declared on the type are ignored.
  for (const auto & field : type->fields) {
    const RawValue * field_raw = raw.find_field(field.name);
    Value coerced = coerce_position(
      field.type, field_raw != nullptr ? *field_raw : RawValue::make_absent(),
      field.default_value, extend_path(path, field.name), source);
    if (!coerced.is_absent()) {
      result.set(field.name, std::move(coerced));
    }
  }

  if (failures_.size() != failures_before) {
    return Value::make_absent();
  }
  return result;
}

// ============================================================================
// Single-Value Convenience API
// ============================================================================

CoercionResult coerce_value(
  const Type * type, const RawValue & raw, AstContext & arena, const VariableResolver * variables,
  const ArgumentPath & path)
{
  CoercionResult result;
  ArgumentCoercer coercer(arena, result.failures, variables);
  result.value = coercer.coerce_position(type, raw, std::nullopt, path, CoercionSource::Literal);
  return result;
}

}  // namespace gql_coerce
