// gql_coerce/coerce/variable_resolver.hpp - Request variable lookup and coercion
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "gql_coerce/ast/ast.hpp"
#include "gql_coerce/basic/failure.hpp"
#include "gql_coerce/schema/type.hpp"
#include "gql_coerce/value/value.hpp"

namespace gql_coerce
{

class ArgumentCoercer;

/**
 * A variable declared in the operation header, with its type resolved
 * against the schema.
 */
struct VariableDefinition
{
  std::string_view name;

  /// Declared type; nullptr when type_name names no schema type
  const Type * type = nullptr;

  /// Declared type as written, for messages
  std::string type_name;

  /// Default literal; nullptr when none is declared
  const ValueNode * default_value = nullptr;
};

/**
 * Resolves `$name` references against the request's variable values.
 *
 * Resolution is invoked by the coercer at the position where a reference
 * appears, with the type expected at that position:
 *
 * - Not supplied, default declared: the default literal is coerced.
 * - Not supplied, no default, declared non-null: MissingRequiredVariable.
 * - Not supplied otherwise: Absent (not an error).
 * - Supplied: the JSON value is normalized structurally and coerced.
 *
 * Holds no mutable state; one resolver can serve concurrent coercers of the
 * same request.
 */
class VariableResolver
{
public:
  /**
   * @param definitions Variables declared by the operation
   * @param supplied Request variables (a JSON object; anything else counts
   *                 as no variables supplied)
   */
  VariableResolver(std::vector<VariableDefinition> definitions, nlohmann::json supplied);

  [[nodiscard]] const VariableDefinition * find_definition(std::string_view name) const noexcept;

  /**
   * Resolve and coerce a variable reference.
   *
   * @param name Variable name without '$'
   * @param expected Type expected at the reference site
   * @param path Argument path of the reference site
   * @param coercer Coercer supplying the arena and failure bag
   * @return Coerced value, or Absent (failures go to the coercer's bag)
   */
  Value resolve(
    std::string_view name, const Type * expected, const ArgumentPath & path,
    ArgumentCoercer & coercer) const;

private:
  std::vector<VariableDefinition> definitions_;
  nlohmann::json supplied_;
};

}  // namespace gql_coerce
