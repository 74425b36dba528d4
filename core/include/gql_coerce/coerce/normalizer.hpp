// gql_coerce/coerce/normalizer.hpp - AST / JSON to RawValue translation
#pragma once

#include <nlohmann/json.hpp>

#include "gql_coerce/ast/ast.hpp"
#include "gql_coerce/ast/ast_context.hpp"
#include "gql_coerce/value/raw_value.hpp"

namespace gql_coerce
{

/**
 * Structural translation into RawValue.
 *
 * Inline literals come from parser value nodes; variable values come from
 * the request's JSON. Both land in the same RawValue shape so the coercer
 * runs one algorithm for either source.
 *
 * Variable references are kept as RawValueKind::Variable; they are resolved
 * later by the coercer against the type expected at their position.
 */
class Normalizer
{
public:
  /**
   * @param arena Arena receiving list/object children and interned strings
   */
  explicit Normalizer(AstContext & arena) : arena_(arena) {}

  /**
   * Normalize a parser value node.
   *
   * @param node Value node, or nullptr for an argument that was not written
   * @return RawValue (Absent when node is nullptr)
   */
  [[nodiscard]] RawValue normalize(const ValueNode * node);

  /**
   * Normalize a request variable value.
   *
   * JSON integers become Int (unsigned values beyond int64 become Float),
   * floats Float, strings String, booleans Boolean, null Null, arrays List
   * and objects Object. No Enum or Variable values are produced.
   */
  [[nodiscard]] RawValue from_json(const nlohmann::json & json);

private:
  AstContext & arena_;
};

}  // namespace gql_coerce
