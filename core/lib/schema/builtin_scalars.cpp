// gql_coerce/schema/builtin_scalars.cpp - Built-in scalar implementations
#include "gql_coerce/schema/builtin_scalars.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <limits>
#include <string>

#include "gql_coerce/value/value_printer.hpp"

namespace gql_coerce::builtin
{

namespace
{

ScalarParseResult type_mismatch(std::string_view type_name, const RawValue & raw)
{
  return ScalarParseResult::fail(
    fmt::format("expected type `{}', found {}", type_name, print_raw(raw)));
}

}  // namespace

// ============================================================================
// Parse
// ============================================================================

ScalarParseResult parse_int(const RawValue & raw)
{
  if (!raw.is_int()) return type_mismatch("Int", raw);

  const int64_t v = raw.as_int();
  if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
    return ScalarParseResult::fail(
      fmt::format("Int cannot represent non 32-bit signed integer value: {}", v));
  }
  return ScalarParseResult::ok(v);
}

ScalarParseResult parse_float(const RawValue & raw)
{
  if (raw.is_float()) return ScalarParseResult::ok(raw.as_float());
  if (raw.is_int()) return ScalarParseResult::ok(static_cast<double>(raw.as_int()));
  return type_mismatch("Float", raw);
}

ScalarParseResult parse_string(const RawValue & raw)
{
  if (!raw.is_string()) return type_mismatch("String", raw);
  return ScalarParseResult::ok(std::string(raw.as_string()));
}

ScalarParseResult parse_boolean(const RawValue & raw)
{
  if (!raw.is_boolean()) return type_mismatch("Boolean", raw);
  return ScalarParseResult::ok(raw.as_boolean());
}

ScalarParseResult parse_id(const RawValue & raw)
{
  if (raw.is_string()) return ScalarParseResult::ok(std::string(raw.as_string()));
  if (raw.is_int()) return ScalarParseResult::ok(std::to_string(raw.as_int()));
  return type_mismatch("ID", raw);
}

// ============================================================================
// Serialize
// ============================================================================

nlohmann::json serialize_int(const std::any & value)
{
  if (const auto * i = std::any_cast<int>(&value)) return *i;
  return std::any_cast<int64_t>(value);
}

nlohmann::json serialize_float(const std::any & value)
{
  if (const auto * i = std::any_cast<int64_t>(&value)) return static_cast<double>(*i);
  return std::any_cast<double>(value);
}

nlohmann::json serialize_string(const std::any & value)
{
  return std::any_cast<std::string>(value);
}

nlohmann::json serialize_boolean(const std::any & value) { return std::any_cast<bool>(value); }

nlohmann::json serialize_id(const std::any & value) { return std::any_cast<std::string>(value); }

}  // namespace gql_coerce::builtin
