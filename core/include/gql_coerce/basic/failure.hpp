// gql_coerce/basic/failure.hpp - Coercion failure records
//
// Coercion never throws for bad user input. Every rejected value becomes a
// CoercionFailure collected in a FailureBag, attributed later to its field.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gql_coerce
{

// ============================================================================
// Failure Kind
// ============================================================================

enum class FailureKind : uint8_t {
  MissingRequiredVariable,     ///< $var of a non-null declared type was not supplied
  ValueRequired,               ///< null/absent at a non-null position
  ScalarCoercionFailed,        ///< scalar parse function rejected the value
  InvalidEnumValue,            ///< not a member of the enum
  ShapeMismatch,               ///< e.g. object expected but list given
  UnknownType,                 ///< variable declared with a type the schema lacks
  ResolutionArgumentMismatch,  ///< resolver did not find an expected argument key
};

[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

// ============================================================================
// Argument Path
// ============================================================================

/// One step into an argument value: an input field name or a list index.
using PathSegment = std::variant<std::string, std::size_t>;

using ArgumentPath = std::vector<PathSegment>;

/// Append a segment, returning the extended copy.
[[nodiscard]] ArgumentPath extend_path(const ArgumentPath & path, PathSegment segment);

/// Render a path as `arg.field[1].other`.
[[nodiscard]] std::string format_path(const ArgumentPath & path);

// ============================================================================
// Coercion Failure
// ============================================================================

struct CoercionFailure
{
  FailureKind kind = FailureKind::ShapeMismatch;
  ArgumentPath path;
  std::string reason;
};

// ============================================================================
// FailureBag
// ============================================================================

class FailureBag
{
public:
  FailureBag() = default;

  FailureBag(const FailureBag &) = default;
  FailureBag & operator=(const FailureBag &) = default;
  FailureBag(FailureBag &&) = default;
  FailureBag & operator=(FailureBag &&) = default;

  void report(FailureKind kind, ArgumentPath path, std::string reason);

  void add(CoercionFailure && failure);
  void add(const CoercionFailure & failure);

  [[nodiscard]] const std::vector<CoercionFailure> & all() const { return failures_; }
  [[nodiscard]] bool empty() const { return failures_.empty(); }
  [[nodiscard]] size_t size() const { return failures_.size(); }

  [[nodiscard]] bool has(FailureKind kind) const;

  void merge(FailureBag && other);
  void merge(const FailureBag & other);

  [[nodiscard]] auto begin() const { return failures_.begin(); }
  [[nodiscard]] auto end() const { return failures_.end(); }

private:
  std::vector<CoercionFailure> failures_;
};

}  // namespace gql_coerce
