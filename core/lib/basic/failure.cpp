// gql_coerce/basic/failure.cpp - Failure bag implementation
#include "gql_coerce/basic/failure.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace gql_coerce
{

std::string_view to_string(FailureKind kind) noexcept
{
  switch (kind) {
    case FailureKind::MissingRequiredVariable:
      return "MissingRequiredVariable";
    case FailureKind::ValueRequired:
      return "ValueRequired";
    case FailureKind::ScalarCoercionFailed:
      return "ScalarCoercionFailed";
    case FailureKind::InvalidEnumValue:
      return "InvalidEnumValue";
    case FailureKind::ShapeMismatch:
      return "ShapeMismatch";
    case FailureKind::UnknownType:
      return "UnknownType";
    case FailureKind::ResolutionArgumentMismatch:
      return "ResolutionArgumentMismatch";
  }
  return "Unknown";
}

// ============================================================================
// Argument Path
// ============================================================================

ArgumentPath extend_path(const ArgumentPath & path, PathSegment segment)
{
  ArgumentPath out = path;
  out.push_back(std::move(segment));
  return out;
}

std::string format_path(const ArgumentPath & path)
{
  std::string out;
  for (const auto & seg : path) {
    if (const auto * name = std::get_if<std::string>(&seg)) {
      if (!out.empty()) out += '.';
      out += *name;
    } else {
      out += fmt::format("[{}]", std::get<std::size_t>(seg));
    }
  }
  return out;
}

// ============================================================================
// FailureBag
// ============================================================================

void FailureBag::report(FailureKind kind, ArgumentPath path, std::string reason)
{
  failures_.push_back(CoercionFailure{kind, std::move(path), std::move(reason)});
}

void FailureBag::add(CoercionFailure && failure) { failures_.push_back(std::move(failure)); }

void FailureBag::add(const CoercionFailure & failure) { failures_.push_back(failure); }

bool FailureBag::has(FailureKind kind) const
{
  return std::any_of(failures_.begin(), failures_.end(), [kind](const CoercionFailure & f) {
    return f.kind == kind;
  });
}

void FailureBag::merge(FailureBag && other)
{
  failures_.insert(
    failures_.end(), std::make_move_iterator(other.failures_.begin()),
    std::make_move_iterator(other.failures_.end()));
  other.failures_.clear();
}

void FailureBag::merge(const FailureBag & other)
{
  failures_.insert(failures_.end(), other.failures_.begin(), other.failures_.end());
}

}  // namespace gql_coerce
