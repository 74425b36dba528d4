// gql_coerce/coerce/argument_coercer.hpp - Recursive argument coercion
//
// Converts raw argument input into typed values according to the declared
// type descriptors. Bad input never throws; every failure is recorded with
// its argument path and coercion continues with sibling positions.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "gql_coerce/ast/ast.hpp"
#include "gql_coerce/ast/ast_context.hpp"
#include "gql_coerce/basic/failure.hpp"
#include "gql_coerce/coerce/normalizer.hpp"
#include "gql_coerce/schema/schema.hpp"
#include "gql_coerce/schema/type.hpp"
#include "gql_coerce/value/raw_value.hpp"
#include "gql_coerce/value/value.hpp"

namespace gql_coerce
{

class VariableResolver;

/**
 * Where a raw value came from. Determines which shapes are legal.
 */
enum class CoercionSource : uint8_t {
  Literal,   ///< Inline query literal; may contain variable references
  Constant,  ///< Variable default literal; no variable references
  Variable,  ///< Request JSON; enum members arrive as strings
};

struct CoercionOptions
{
  /// Report ValueRequired for a non-null argument left out of the query
  /// with no default. Off: the argument is omitted from the map and the
  /// resolver decides.
  bool strict_required_arguments = false;
};

/**
 * Recursive argument coercer.
 *
 * ## Algorithm (by case on the expected type)
 * - Variable reference: resolved through the VariableResolver against the
 *   type expected here; the result is returned as is.
 * - NonNull: Absent or null fails with ValueRequired; else recurse inward.
 * - Scalar: Absent/null pass through; else the scalar's parse function.
 * - Enum: a bare symbol (a string when variable-sourced) naming a member.
 * - List: a list, coerced element-wise; no singleton promotion.
 * - InputObject: an object; declared fields in order, defaults for Absent
 *   keys, unknown keys dropped.
 *
 * Defaults replace Absent only, never an explicit null.
 *
 * ## Usage
 * ```cpp
 * FailureBag failures;
 * ArgumentCoercer coercer(arena, failures, &variables);
 * ArgumentMap args = coercer.coerce_arguments(field_def, *field_node);
 * if (!failures.empty()) { ... }
 * ```
 */
class ArgumentCoercer
{
public:
  /**
   * @param arena Arena for raw values normalized during coercion
   * @param failures Bag receiving every coercion failure
   * @param variables Request variables (nullptr: no variables supplied)
   * @param options Coercion options
   */
  ArgumentCoercer(
    AstContext & arena, FailureBag & failures, const VariableResolver * variables = nullptr,
    CoercionOptions options = {});

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Coerce all declared arguments of a field.
   *
   * @return Object value holding only arguments whose result is not Absent
   */
  ArgumentMap coerce_arguments(const FieldDef & field, const FieldNode & node);

  /**
   * Coerce one raw value against a type.
   *
   * @return Coerced value; Absent on failure (see failures())
   */
  Value coerce(
    const Type * type, const RawValue & raw, const ArgumentPath & path,
    CoercionSource source = CoercionSource::Literal);

  /**
   * Coerce the value at a defaultable position (argument or input field).
   *
   * The default is used when raw is Absent, or when raw is a variable
   * reference that resolves to Absent.
   */
  Value coerce_position(
    const Type * type, const RawValue & raw, const std::optional<Value> & default_value,
    const ArgumentPath & path, CoercionSource source);

  [[nodiscard]] Normalizer & normalizer() noexcept { return normalizer_; }
  [[nodiscard]] FailureBag & failures() noexcept { return failures_; }

private:
  Value coerce_variable(
    const Type * type, std::string_view name, const std::optional<Value> * default_value,
    const ArgumentPath & path);
  Value coerce_scalar(const Type * type, const RawValue & raw, const ArgumentPath & path);
  Value coerce_enum(
    const Type * type, const RawValue & raw, const ArgumentPath & path, CoercionSource source);
  Value coerce_list(
    const Type * type, const RawValue & raw, const ArgumentPath & path, CoercionSource source);
  Value coerce_input_object(
    const Type * type, const RawValue & raw, const ArgumentPath & path, CoercionSource source);

  Normalizer normalizer_;
  FailureBag & failures_;
  const VariableResolver * variables_;
  CoercionOptions options_;
};

// ============================================================================
// Single-Value Convenience API
// ============================================================================

struct CoercionResult
{
  Value value;
  FailureBag failures;

  [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

/**
 * Coerce one raw value with a fresh failure bag.
 */
[[nodiscard]] CoercionResult coerce_value(
  const Type * type, const RawValue & raw, AstContext & arena,
  const VariableResolver * variables = nullptr, const ArgumentPath & path = {});

}  // namespace gql_coerce
