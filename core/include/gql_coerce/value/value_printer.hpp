// gql_coerce/value/value_printer.hpp - Text and JSON rendering of values
#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "gql_coerce/value/raw_value.hpp"
#include "gql_coerce/value/value.hpp"

namespace gql_coerce
{

/**
 * Render a raw value in query syntax, as used inside failure reasons.
 *
 * Strings are quoted and escaped, enum symbols are bare, variables keep
 * their '$' and Absent renders as `<absent>`.
 */
[[nodiscard]] std::string print_raw(const RawValue & raw);

/**
 * Debug rendering of a coerced value or argument map.
 *
 * Objects render as `%{key: value}` (an empty argument map is `%{}`),
 * lists as `[a, b]`, null as `nil`. Built-in scalar payloads are printed
 * by value; other payloads as `#<scalar>`.
 */
[[nodiscard]] std::string inspect(const Value & value);

/**
 * Serialize a raw value to JSON.
 *
 * @return `{"kind": "...", "value": ...}` with nested kinds for lists and
 *         objects
 */
[[nodiscard]] nlohmann::json to_json(const RawValue & raw);

}  // namespace gql_coerce
