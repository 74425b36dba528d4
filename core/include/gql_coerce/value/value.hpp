// gql_coerce/value/value.hpp - Coerced value representation
//
// Typed values produced by coercion and consumed by resolvers. Resolvers also
// return Values, which the executor serializes through the field's type.
//
#pragma once

#include <any>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gql_coerce
{

enum class ValueKind : uint8_t {
  Absent,  ///< No value determined; never stored in an argument map
  Null,    ///< Explicit null
  Scalar,  ///< Domain value produced by a scalar's parse function
  Enum,    ///< Enum member symbol
  List,
  Object,  ///< Ordered mapping from field name to value
};

/**
 * Coerced value.
 *
 * Scalar payloads are type-erased so custom scalars can produce any C++
 * type; built-in scalars produce int64_t (Int), double (Float), bool
 * (Boolean) and std::string (String, ID).
 *
 * Object entries keep insertion order, which is the declaration order of
 * the input object's fields.
 */
class Value
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_absent() { return Value{}; }

  static Value make_null()
  {
    Value v;
    v.kind_ = ValueKind::Null;
    return v;
  }

  static Value make_scalar(std::any payload)
  {
    Value v;
    v.kind_ = ValueKind::Scalar;
    v.scalar_ = std::move(payload);
    return v;
  }

  static Value make_enum(std::string symbol)
  {
    Value v;
    v.kind_ = ValueKind::Enum;
    v.symbol_ = std::move(symbol);
    return v;
  }

  static Value make_list(std::vector<Value> elements)
  {
    Value v;
    v.kind_ = ValueKind::List;
    v.elements_ = std::move(elements);
    return v;
  }

  /// Create an empty object; populate with set()
  static Value make_object()
  {
    Value v;
    v.kind_ = ValueKind::Object;
    return v;
  }

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_absent() const noexcept { return kind_ == ValueKind::Absent; }
  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }
  [[nodiscard]] bool is_scalar() const noexcept { return kind_ == ValueKind::Scalar; }
  [[nodiscard]] bool is_enum() const noexcept { return kind_ == ValueKind::Enum; }
  [[nodiscard]] bool is_list() const noexcept { return kind_ == ValueKind::List; }
  [[nodiscard]] bool is_object() const noexcept { return kind_ == ValueKind::Object; }

  // ===========================================================================
  // Accessors
  // ===========================================================================

  /// Scalar payload (empty std::any unless is_scalar())
  [[nodiscard]] const std::any & scalar() const noexcept { return scalar_; }

  /// Typed scalar payload, nullptr when not a scalar of type T
  template <typename T>
  [[nodiscard]] const T * get_if() const noexcept
  {
    return std::any_cast<T>(&scalar_);
  }

  [[nodiscard]] const std::string & enum_symbol() const noexcept { return symbol_; }

  [[nodiscard]] const std::vector<Value> & as_list() const noexcept { return elements_; }

  // ===========================================================================
  // Object Entries
  // ===========================================================================

  /// Insert or replace an entry (object values only)
  void set(std::string name, Value value);

  [[nodiscard]] const Value * find(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept
  {
    return find(name) != nullptr;
  }

  [[nodiscard]] size_t size() const noexcept
  {
    return is_object() ? keys_.size() : elements_.size();
  }

  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  [[nodiscard]] const std::vector<std::string> & keys() const noexcept { return keys_; }

  /// Entry value at position i (objects: parallel to keys())
  [[nodiscard]] const Value & entry(size_t i) const { return elements_.at(i); }

private:
  ValueKind kind_ = ValueKind::Absent;
  std::any scalar_;
  std::string symbol_;
  std::vector<std::string> keys_;  ///< Object keys, parallel to elements_
  std::vector<Value> elements_;    ///< List elements or object entry values
};

/// Arguments handed to a resolver: an Object value holding only the
/// arguments whose coerced result was not Absent.
using ArgumentMap = Value;

}  // namespace gql_coerce
