// gql_coerce/schema/schema.hpp - Root query fields and their arguments
//
// The schema DSL is an external collaborator; this is the built form it
// hands to the engine: a TypeContext plus root query field definitions.
//
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gql_coerce/basic/failure.hpp"
#include "gql_coerce/schema/type.hpp"
#include "gql_coerce/value/value.hpp"

namespace gql_coerce
{

// ============================================================================
// Resolver Contract
// ============================================================================

/**
 * Outcome of a resolver call.
 */
struct ResolveResult
{
  /// Result value (only valid if success == true)
  Value value;

  bool success = false;

  /// Reason shown to the user as "Field `<name>': <error>"
  std::string error;

  /// Set when the failure has a known classification
  std::optional<FailureKind> kind;

  static ResolveResult ok(Value v)
  {
    ResolveResult r;
    r.value = std::move(v);
    r.success = true;
    return r;
  }

  static ResolveResult fail(std::string msg)
  {
    ResolveResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }

  /**
   * Failure for a resolver that did not find the argument keys it expects.
   *
   * The coercer omits arguments that were never supplied, so resolvers
   * match defensively on the map; this renders the map they got,
   * e.g. "Got %{} instead".
   */
  static ResolveResult argument_mismatch(const ArgumentMap & args);
};

using Resolver = std::function<ResolveResult(const ArgumentMap &)>;

// ============================================================================
// Field Definitions
// ============================================================================

struct ArgumentDef
{
  std::string name;
  const Type * type = nullptr;
  std::optional<Value> default_value;
};

struct FieldDef
{
  std::string name;

  /// Return type, used to serialize the resolver's value
  const Type * type = nullptr;

  /// Declared arguments, in declaration order
  std::vector<ArgumentDef> arguments;

  Resolver resolve;

  [[nodiscard]] const ArgumentDef * find_argument(std::string_view arg_name) const noexcept
  {
    for (const auto & a : arguments) {
      if (a.name == arg_name) return &a;
    }
    return nullptr;
  }
};

// ============================================================================
// Schema
// ============================================================================

/**
 * Built schema: type descriptors plus root query fields.
 *
 * Populate it once, then share it read-only between executions.
 */
class Schema
{
public:
  Schema() = default;

  Schema(const Schema &) = delete;
  Schema & operator=(const Schema &) = delete;

  [[nodiscard]] TypeContext & types() noexcept { return types_; }
  [[nodiscard]] const TypeContext & types() const noexcept { return types_; }

  void add_query_field(FieldDef field) { query_fields_.push_back(std::move(field)); }

  [[nodiscard]] const FieldDef * find_query_field(std::string_view name) const noexcept
  {
    for (const auto & f : query_fields_) {
      if (f.name == name) return &f;
    }
    return nullptr;
  }

  [[nodiscard]] const std::vector<FieldDef> & query_fields() const noexcept
  {
    return query_fields_;
  }

private:
  TypeContext types_;
  std::vector<FieldDef> query_fields_;
};

}  // namespace gql_coerce
