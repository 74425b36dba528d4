// gql_coerce/value/raw_value.hpp - Pre-coercion value representation
//
// Uniform shape for argument input, whether it came from an inline literal or
// from a request variable. Raw values are trivially copyable views into an
// AstContext arena.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

namespace gql_coerce
{

// ============================================================================
// Raw Value Kind
// ============================================================================

enum class RawValueKind : uint8_t {
  Int,
  Float,
  String,
  Boolean,
  Enum,      ///< Bare symbol, literal syntax only
  List,
  Object,
  Null,      ///< Explicit null
  Variable,  ///< Unresolved `$name` reference
  Absent,    ///< Not supplied at all (distinct from Null)
};

struct RawField;

// ============================================================================
// Raw Value
// ============================================================================

/**
 * Pre-coercion input value.
 *
 * Values are stored in their most general form:
 * - Integers as int64_t
 * - Floats as double
 * - Strings, enum symbols and variable names as interned string_view
 * - Lists and objects as spans of arena-allocated children
 *
 * Default construction yields Absent.
 */
class RawValue
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static RawValue make_int(int64_t value)
  {
    RawValue v;
    v.kind_ = RawValueKind::Int;
    v.int_value_ = value;
    return v;
  }

  static RawValue make_float(double value)
  {
    RawValue v;
    v.kind_ = RawValueKind::Float;
    v.float_value_ = value;
    return v;
  }

  /// Create a string (value must be arena-interned)
  static RawValue make_string(std::string_view value)
  {
    RawValue v;
    v.kind_ = RawValueKind::String;
    v.text_ = value;
    return v;
  }

  static RawValue make_boolean(bool value)
  {
    RawValue v;
    v.kind_ = RawValueKind::Boolean;
    v.bool_value_ = value;
    return v;
  }

  /// Create a bare enum symbol (name must be arena-interned)
  static RawValue make_enum(std::string_view name)
  {
    RawValue v;
    v.kind_ = RawValueKind::Enum;
    v.text_ = name;
    return v;
  }

  /// Create a list (elements must be arena-allocated)
  static RawValue make_list(gsl::span<const RawValue> elements)
  {
    RawValue v;
    v.kind_ = RawValueKind::List;
    v.list_ = elements;
    return v;
  }

  /// Create an object (fields must be arena-allocated)
  static RawValue make_object(gsl::span<const RawField> fields)
  {
    RawValue v;
    v.kind_ = RawValueKind::Object;
    v.fields_ = fields;
    return v;
  }

  static RawValue make_null()
  {
    RawValue v;
    v.kind_ = RawValueKind::Null;
    return v;
  }

  /// Create a variable reference (name without '$', arena-interned)
  static RawValue make_variable(std::string_view name)
  {
    RawValue v;
    v.kind_ = RawValueKind::Variable;
    v.text_ = name;
    return v;
  }

  static RawValue make_absent() { return RawValue{}; }

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] RawValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_int() const noexcept { return kind_ == RawValueKind::Int; }
  [[nodiscard]] bool is_float() const noexcept { return kind_ == RawValueKind::Float; }
  [[nodiscard]] bool is_string() const noexcept { return kind_ == RawValueKind::String; }
  [[nodiscard]] bool is_boolean() const noexcept { return kind_ == RawValueKind::Boolean; }
  [[nodiscard]] bool is_enum() const noexcept { return kind_ == RawValueKind::Enum; }
  [[nodiscard]] bool is_list() const noexcept { return kind_ == RawValueKind::List; }
  [[nodiscard]] bool is_object() const noexcept { return kind_ == RawValueKind::Object; }
  [[nodiscard]] bool is_null() const noexcept { return kind_ == RawValueKind::Null; }
  [[nodiscard]] bool is_variable() const noexcept { return kind_ == RawValueKind::Variable; }
  [[nodiscard]] bool is_absent() const noexcept { return kind_ == RawValueKind::Absent; }

  /// Absent or explicit null
  [[nodiscard]] bool is_null_or_absent() const noexcept { return is_null() || is_absent(); }

  // ===========================================================================
  // Value Accessors
  // ===========================================================================

  [[nodiscard]] int64_t as_int() const noexcept { return int_value_; }

  [[nodiscard]] double as_float() const noexcept { return float_value_; }

  [[nodiscard]] bool as_boolean() const noexcept { return bool_value_; }

  /// String contents (only valid if is_string())
  [[nodiscard]] std::string_view as_string() const noexcept { return text_; }

  /// Enum symbol (only valid if is_enum())
  [[nodiscard]] std::string_view enum_name() const noexcept { return text_; }

  /// Variable name (only valid if is_variable())
  [[nodiscard]] std::string_view variable_name() const noexcept { return text_; }

  [[nodiscard]] gsl::span<const RawValue> as_list() const noexcept { return list_; }

  [[nodiscard]] gsl::span<const RawField> as_object() const noexcept { return fields_; }

  /// Look up an object field by name; nullptr when missing or not an object
  [[nodiscard]] const RawValue * find_field(std::string_view name) const noexcept;

private:
  RawValueKind kind_ = RawValueKind::Absent;
  int64_t int_value_ = 0;
  double float_value_ = 0.0;
  bool bool_value_ = false;
  std::string_view text_;
  gsl::span<const RawValue> list_;
  gsl::span<const RawField> fields_;
};

/// `name: value` entry of an object value.
struct RawField
{
  std::string_view name;
  RawValue value;
};

inline const RawValue * RawValue::find_field(std::string_view name) const noexcept
{
  if (!is_object()) return nullptr;
  for (const auto & f : fields_) {
    if (f.name == name) return &f.value;
  }
  return nullptr;
}

}  // namespace gql_coerce
