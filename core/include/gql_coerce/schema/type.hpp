// gql_coerce/schema/type.hpp - Type descriptor model
//
// Closed recursive description of schema input types. Coercion switches
// over TypeKind exhaustively; there is no open class hierarchy.
//
#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gql_coerce/value/raw_value.hpp"
#include "gql_coerce/value/value.hpp"

namespace gql_coerce
{

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  Scalar,
  Enum,
  InputObject,
  List,     ///< [T]
  NonNull,  ///< T!
};

// ============================================================================
// Scalar Functions
// ============================================================================

/**
 * Outcome of a scalar parse function.
 */
struct ScalarParseResult
{
  /// Parsed domain value (only valid if success == true)
  std::any value;

  bool success = false;

  /// Human-readable rejection reason
  std::string error;

  static ScalarParseResult ok(std::any v)
  {
    ScalarParseResult r;
    r.value = std::move(v);
    r.success = true;
    return r;
  }

  static ScalarParseResult fail(std::string msg)
  {
    ScalarParseResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/// Parse a raw value (never Absent, Null or Variable) into a domain value.
using ScalarParseFn = std::function<ScalarParseResult(const RawValue &)>;

/// Render a domain value to its external form. May throw std::bad_any_cast
/// when handed a payload of the wrong type.
using ScalarSerializeFn = std::function<nlohmann::json(const std::any &)>;

// ============================================================================
// Type
// ============================================================================

struct Type;

/// Declared field of an input object.
struct InputField
{
  std::string name;
  const Type * type = nullptr;
  std::optional<Value> default_value;
};

/**
 * Type descriptor.
 *
 * Named kinds (Scalar, Enum, InputObject) carry a name and their payload;
 * wrapper kinds (List, NonNull) carry only of_type. Descriptors are owned by
 * TypeContext and never modified once the schema is built.
 */
struct Type
{
  TypeKind kind;

  /// For Scalar/Enum/InputObject: type name
  std::string name;

  /// For List/NonNull: wrapped type
  const Type * of_type = nullptr;

  /// For Scalar
  ScalarParseFn parse;
  ScalarSerializeFn serialize;

  /// For Enum: member symbols
  std::vector<std::string> enum_values;

  /// For InputObject: fields in declaration order
  std::vector<InputField> fields;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_scalar() const noexcept { return kind == TypeKind::Scalar; }
  [[nodiscard]] bool is_enum() const noexcept { return kind == TypeKind::Enum; }
  [[nodiscard]] bool is_input_object() const noexcept { return kind == TypeKind::InputObject; }
  [[nodiscard]] bool is_list() const noexcept { return kind == TypeKind::List; }
  [[nodiscard]] bool is_non_null() const noexcept { return kind == TypeKind::NonNull; }

  /// Check if this is a wrapper (List or NonNull)
  [[nodiscard]] bool is_wrapper() const noexcept { return is_list() || is_non_null(); }

  /// Strip NonNull (one level; NonNull never wraps NonNull)
  [[nodiscard]] const Type * nullable() const noexcept { return is_non_null() ? of_type : this; }

  /// Innermost named type
  [[nodiscard]] const Type * named_type() const noexcept
  {
    const Type * t = this;
    while (t->is_wrapper()) t = t->of_type;
    return t;
  }

  [[nodiscard]] bool has_enum_value(std::string_view symbol) const noexcept
  {
    for (const auto & v : enum_values) {
      if (v == symbol) return true;
    }
    return false;
  }

  [[nodiscard]] const InputField * find_field(std::string_view field_name) const noexcept
  {
    for (const auto & f : fields) {
      if (f.name == field_name) return &f;
    }
    return nullptr;
  }

  /// Type as written in a query: `[Int!]!`, `ContactInput`
  [[nodiscard]] std::string display_name() const;
};

// ============================================================================
// Wrapper Type Table
// ============================================================================

/**
 * Interned List/NonNull descriptors over types owned elsewhere.
 *
 * TypeContext keeps one for the schema's own wrappers. An execution keeps
 * another for the wrappers its variable declarations spell out, so a
 * request never adds descriptors to the shared schema. Not thread-safe.
 */
class WrapperTypeTable
{
public:
  WrapperTypeTable() = default;

  WrapperTypeTable(const WrapperTypeTable &) = delete;
  WrapperTypeTable & operator=(const WrapperTypeTable &) = delete;

  /// [T]
  const Type * list_of(const Type * of_type);

  /// T!; returns of_type itself when already NonNull
  const Type * non_null_of(const Type * of_type);

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  const Type * intern(TypeKind kind, const Type * of_type);

  // Element addresses must survive push_back.
  std::deque<Type> types_;
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owner of every type descriptor in a schema.
 *
 * Provides the built-in scalars (Int, Float, String, Boolean, ID), holds
 * user-defined named types, and interns wrapper types so the same inner
 * type always yields the same List/NonNull descriptor.
 *
 * Everything here is populated while the schema is built. Executions only
 * read it, so it carries no lock.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;
  TypeContext(TypeContext &&) = delete;
  TypeContext & operator=(TypeContext &&) = delete;

  // ===========================================================================
  // Built-in Scalars (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * int_type() const noexcept { return &int_; }
  [[nodiscard]] const Type * float_type() const noexcept { return &float_; }
  [[nodiscard]] const Type * string_type() const noexcept { return &string_; }
  [[nodiscard]] const Type * boolean_type() const noexcept { return &boolean_; }
  [[nodiscard]] const Type * id_type() const noexcept { return &id_; }

  // ===========================================================================
  // Named Type Definition (schema build time)
  // ===========================================================================

  const Type * define_scalar(std::string name, ScalarParseFn parse, ScalarSerializeFn serialize);

  const Type * define_enum(std::string name, std::vector<std::string> values);

  /**
   * Define an input object.
   *
   * Returns a mutable descriptor so self-referential input objects can add
   * fields after the type exists. Fields must not change once the schema is
   * in use.
   */
  Type * define_input_object(std::string name, std::vector<InputField> fields = {});

  // ===========================================================================
  // Wrapper Types (Interned)
  // ===========================================================================

  /// Get list type: [T]
  const Type * get_list_type(const Type * of_type) { return wrappers_.list_of(of_type); }

  /// Get non-null type: T! (returns of_type itself when already NonNull)
  const Type * get_non_null_type(const Type * of_type) { return wrappers_.non_null_of(of_type); }

  [[nodiscard]] size_t wrapper_count() const noexcept { return wrappers_.size(); }

  // ===========================================================================
  // Type Lookup by Name
  // ===========================================================================

  /// Look up a built-in or defined named type; nullptr when unknown
  [[nodiscard]] const Type * lookup(std::string_view name) const;

private:
  Type int_, float_, string_, boolean_, id_;

  // NOTE: pointers to types are handed out widely; deque keeps element
  // addresses stable across push_back.
  std::deque<Type> named_types_;
  WrapperTypeTable wrappers_;
};

}  // namespace gql_coerce
