// gql_coerce/ast/ast.hpp - Query AST node definitions
//
// The parser is an external collaborator; these classes are the interface it
// builds into. Nodes follow the classof() pattern and are owned by AstContext.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "gql_coerce/ast/ast_enums.hpp"
#include "gql_coerce/basic/casting.hpp"

namespace gql_coerce
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

protected:
  explicit AstNode(NodeKind k) : kind(k) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  NodeBase() : Base(K) {}
};

/**
 * Base class for value nodes (argument values, list elements, object fields).
 */
class ValueNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_value_kind(node->kind); }

protected:
  explicit ValueNode(NodeKind k) : AstNode(k) {}
};

/**
 * Base class for type references in variable definitions.
 */
class TypeRefNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_ref_kind(node->kind); }

protected:
  explicit TypeRefNode(NodeKind k) : AstNode(k) {}
};

// ============================================================================
// Value Nodes
// ============================================================================

class IntValueNode : public NodeBase<IntValueNode, ValueNode, NodeKind::IntValue>
{
public:
  int64_t value;

  explicit IntValueNode(int64_t v) : value(v) {}
};

class FloatValueNode : public NodeBase<FloatValueNode, ValueNode, NodeKind::FloatValue>
{
public:
  double value;

  explicit FloatValueNode(double v) : value(v) {}
};

/// Quoted string literal (escapes already processed by the parser).
class StringValueNode : public NodeBase<StringValueNode, ValueNode, NodeKind::StringValue>
{
public:
  std::string_view value;

  explicit StringValueNode(std::string_view v) : value(v) {}
};

class BooleanValueNode : public NodeBase<BooleanValueNode, ValueNode, NodeKind::BooleanValue>
{
public:
  bool value;

  explicit BooleanValueNode(bool v) : value(v) {}
};

class NullValueNode : public NodeBase<NullValueNode, ValueNode, NodeKind::NullValue>
{
public:
  NullValueNode() = default;
};

/// Bare symbolic literal, e.g. `RED`.
class EnumValueNode : public NodeBase<EnumValueNode, ValueNode, NodeKind::EnumValue>
{
public:
  std::string_view name;

  explicit EnumValueNode(std::string_view n) : name(n) {}
};

class ListValueNode : public NodeBase<ListValueNode, ValueNode, NodeKind::ListValue>
{
public:
  gsl::span<ValueNode *> elements;

  explicit ListValueNode(gsl::span<ValueNode *> elems) : elements(elems) {}
};

class ObjectFieldNode;

class ObjectValueNode : public NodeBase<ObjectValueNode, ValueNode, NodeKind::ObjectValue>
{
public:
  gsl::span<ObjectFieldNode *> fields;

  explicit ObjectValueNode(gsl::span<ObjectFieldNode *> f) : fields(f) {}
};

/// `$name` reference. Resolution happens during coercion, not here.
class VariableNode : public NodeBase<VariableNode, ValueNode, NodeKind::Variable>
{
public:
  std::string_view name;  ///< Without the leading '$'

  explicit VariableNode(std::string_view n) : name(n) {}
};

// ============================================================================
// Type References
// ============================================================================

class NamedTypeNode : public NodeBase<NamedTypeNode, TypeRefNode, NodeKind::NamedType>
{
public:
  std::string_view name;

  explicit NamedTypeNode(std::string_view n) : name(n) {}
};

class ListTypeNode : public NodeBase<ListTypeNode, TypeRefNode, NodeKind::ListType>
{
public:
  TypeRefNode * of_type;

  explicit ListTypeNode(TypeRefNode * t) : of_type(t) {}
};

class NonNullTypeNode : public NodeBase<NonNullTypeNode, TypeRefNode, NodeKind::NonNullType>
{
public:
  TypeRefNode * of_type;  ///< NamedTypeNode or ListTypeNode

  explicit NonNullTypeNode(TypeRefNode * t) : of_type(t) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// `name: value` inside an object literal.
class ObjectFieldNode : public NodeBase<ObjectFieldNode, AstNode, NodeKind::ObjectField>
{
public:
  std::string_view name;
  ValueNode * value;

  ObjectFieldNode(std::string_view n, ValueNode * v) : name(n), value(v) {}
};

/// `name: value` in a field's argument list.
class ArgumentNode : public NodeBase<ArgumentNode, AstNode, NodeKind::Argument>
{
public:
  std::string_view name;
  ValueNode * value;

  ArgumentNode(std::string_view n, ValueNode * v) : name(n), value(v) {}
};

/// `$name: Type = default` in an operation header.
class VariableDefinitionNode
: public NodeBase<VariableDefinitionNode, AstNode, NodeKind::VariableDefinition>
{
public:
  std::string_view name;
  TypeRefNode * type;
  ValueNode * default_value = nullptr;  ///< nullptr when no default is declared

  VariableDefinitionNode(std::string_view n, TypeRefNode * t, ValueNode * d = nullptr)
  : name(n), type(t), default_value(d)
  {
  }
};

/// A root field selection with its arguments.
class FieldNode : public NodeBase<FieldNode, AstNode, NodeKind::Field>
{
public:
  std::string_view name;
  std::string_view alias;  ///< Empty when not aliased
  gsl::span<ArgumentNode *> arguments;

  FieldNode(std::string_view n, gsl::span<ArgumentNode *> args) : name(n), arguments(args) {}

  /// Key under which the field's result appears in the response.
  [[nodiscard]] std::string_view response_key() const noexcept
  {
    return alias.empty() ? name : alias;
  }

  [[nodiscard]] const ArgumentNode * find_argument(std::string_view arg_name) const noexcept
  {
    for (const auto * arg : arguments) {
      if (arg->name == arg_name) return arg;
    }
    return nullptr;
  }
};

/// A query operation: optional name, variable definitions, root selections.
class OperationNode : public NodeBase<OperationNode, AstNode, NodeKind::Operation>
{
public:
  std::string_view name;
  gsl::span<VariableDefinitionNode *> variable_definitions;
  gsl::span<FieldNode *> selections;

  OperationNode(
    std::string_view n, gsl::span<VariableDefinitionNode *> vars, gsl::span<FieldNode *> sel)
  : name(n), variable_definitions(vars), selections(sel)
  {
  }
};

}  // namespace gql_coerce
