// gql_coerce/coerce/error_aggregator.cpp - Field-scoped error messages
#include "gql_coerce/coerce/error_aggregator.hpp"

#include <fmt/core.h>

namespace gql_coerce
{

nlohmann::json FieldError::to_json() const { return {{"message", message}}; }

FieldError report(std::string_view field_name, const FailureBag & failures)
{
  std::string reasons;
  for (const auto & f : failures) {
    if (!reasons.empty()) reasons += "; ";
    if (f.path.empty()) {
      reasons += f.reason;
    } else {
      reasons += fmt::format("Argument `{}': {}", format_path(f.path), f.reason);
    }
  }
  return report(field_name, reasons);
}

FieldError report(std::string_view field_name, std::string_view reason)
{
  FieldError err;
  err.field = std::string(field_name);
  err.message = fmt::format("Field `{}': {}", field_name, reason);
  return err;
}

}  // namespace gql_coerce
