// gql_coerce/basic/casting.hpp - Kind-tag casting for AST nodes
//
// AST nodes form a closed hierarchy tagged by NodeKind. Every concrete or
// abstract node class exposes `static bool classof(const AstNode *)`; these
// helpers dispatch on it instead of dynamic_cast.
//
//   if (isa<ValueNode>(node)) { ... }
//   const auto * list = cast<ListValueNode>(node);           // kind known
//   if (const auto * v = dyn_cast<VariableNode>(node)) { ... }  // kind unknown
//
#pragma once

#include <cassert>
#include <type_traits>

namespace gql_coerce
{

class AstNode;

/// True when node is non-null and T::classof accepts it.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(std::is_base_of_v<AstNode, From>, "isa<> works on AST nodes only");
  return node != nullptr && T::classof(node);
}

/// Downcast a node whose kind the caller has already established.
template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<const T *>(node);
}

/// Downcast, or nullptr when the node is null or of another kind.
template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace gql_coerce
