// gql_coerce/coerce/error_aggregator.hpp - Field-scoped error messages
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "gql_coerce/basic/failure.hpp"

namespace gql_coerce
{

/**
 * User-visible error attributed to one field.
 */
struct FieldError
{
  /// Response key of the failed field
  std::string field;

  /// "Field `<field>': <reason>"
  std::string message;

  /// `{"message": ...}` as placed in the response's error list
  [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * Merge all argument failures of a field into one error.
 *
 * Each failure renders as "Argument `<path>': <reason>"; several are joined
 * with "; ".
 *
 * Example:
 *   Field `numbers': Argument `numbers[1]': expected type `Int', found "x"
 */
[[nodiscard]] FieldError report(std::string_view field_name, const FailureBag & failures);

/**
 * Build a field error from a single reason (e.g. a resolver's error).
 */
[[nodiscard]] FieldError report(std::string_view field_name, std::string_view reason);

}  // namespace gql_coerce
