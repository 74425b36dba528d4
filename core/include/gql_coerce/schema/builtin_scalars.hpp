// gql_coerce/schema/builtin_scalars.hpp - Parse/serialize for built-in scalars
//
// Int    : integer literal within 32-bit range -> int64_t
// Float  : integer or float literal -> double
// String : string literal -> std::string
// Boolean: boolean literal -> bool
// ID     : string or integer literal -> std::string
//
#pragma once

#include <any>
#include <nlohmann/json.hpp>

#include "gql_coerce/schema/type.hpp"
#include "gql_coerce/value/raw_value.hpp"

namespace gql_coerce::builtin
{

[[nodiscard]] ScalarParseResult parse_int(const RawValue & raw);
[[nodiscard]] ScalarParseResult parse_float(const RawValue & raw);
[[nodiscard]] ScalarParseResult parse_string(const RawValue & raw);
[[nodiscard]] ScalarParseResult parse_boolean(const RawValue & raw);
[[nodiscard]] ScalarParseResult parse_id(const RawValue & raw);

// Serializers accept the payload their parser produces; Int also accepts
// int, Float also accepts integers.
[[nodiscard]] nlohmann::json serialize_int(const std::any & value);
[[nodiscard]] nlohmann::json serialize_float(const std::any & value);
[[nodiscard]] nlohmann::json serialize_string(const std::any & value);
[[nodiscard]] nlohmann::json serialize_boolean(const std::any & value);
[[nodiscard]] nlohmann::json serialize_id(const std::any & value);

}  // namespace gql_coerce::builtin
