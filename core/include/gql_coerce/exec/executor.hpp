// gql_coerce/exec/executor.hpp - Root field execution
//
// Coerces each root field's arguments, calls its resolver and serializes the
// result. A failing field contributes one error and no data; its siblings
// are unaffected.
//
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "gql_coerce/ast/ast.hpp"
#include "gql_coerce/coerce/error_aggregator.hpp"
#include "gql_coerce/coerce/variable_resolver.hpp"
#include "gql_coerce/project/engine_config.hpp"
#include "gql_coerce/schema/schema.hpp"

namespace gql_coerce
{

struct ExecutionResult
{
  /// Response key -> serialized value, for fields that succeeded
  nlohmann::json data = nlohmann::json::object();

  std::vector<FieldError> errors;

  [[nodiscard]] bool has_errors() const noexcept { return !errors.empty(); }

  /// `{"data": ..., "errors": [...]}`; "errors" only when non-empty
  [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * Executes the root selections of one operation against a schema.
 *
 * The executor is stateless between calls; one instance may serve many
 * requests concurrently.
 *
 * ## Usage
 * ```cpp
 * Executor exec(schema);
 * ExecutionResult result = exec.execute(*operation, variables);
 * std::string body = result.to_json().dump();
 * ```
 */
class Executor
{
public:
  explicit Executor(const Schema & schema, EngineConfig config = {});

  /**
   * Execute an operation.
   *
   * @param operation Parsed operation (variables and root selections)
   * @param variables Request variable values (JSON object)
   */
  [[nodiscard]] ExecutionResult execute(
    const OperationNode & operation,
    const nlohmann::json & variables = nlohmann::json::object()) const;

private:
  struct FieldOutcome
  {
    std::string key;
    std::optional<nlohmann::json> data;
    std::optional<FieldError> error;
  };

  [[nodiscard]] FieldOutcome execute_field(
    const FieldNode & node, const VariableResolver & variables) const;

  /// Wrappers spelled by the declarations are interned into declared_wrappers,
  /// which must outlive the returned definitions
  [[nodiscard]] std::vector<VariableDefinition> resolve_variable_definitions(
    const OperationNode & operation, WrapperTypeTable & declared_wrappers) const;

  /// Resolve a type reference; nullptr when a named type is unknown
  [[nodiscard]] const Type * resolve_type_ref(
    const TypeRefNode * node, WrapperTypeTable & declared_wrappers) const;

  /// Serialize a resolver value through its field type; false with error set
  /// when the value does not fit the type
  bool serialize(
    const Type * type, const Value & value, nlohmann::json & out, std::string & error) const;

  const Schema & schema_;
  EngineConfig config_;
};

/// Type reference as written in the query: `[Int!]!`
[[nodiscard]] std::string format_type_ref(const TypeRefNode * node);

}  // namespace gql_coerce
