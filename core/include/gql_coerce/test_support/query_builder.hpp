// gql_coerce/test_support/query_builder.hpp - helpers for unit/integration tests
//
// The query parser lives outside this library, so tests build the parser's
// AST directly. QueryBuilder keeps the AstContext alive alongside the nodes
// it creates.
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "gql_coerce/ast/ast.hpp"
#include "gql_coerce/ast/ast_context.hpp"

namespace gql_coerce::test_support
{

class QueryBuilder
{
public:
  QueryBuilder() : ast_(std::make_unique<AstContext>()) {}

  [[nodiscard]] AstContext & ast() noexcept { return *ast_; }

  // ===========================================================================
  // Values
  // ===========================================================================

  ValueNode * int_value(int64_t v) { return ast_->create<IntValueNode>(v); }
  ValueNode * float_value(double v) { return ast_->create<FloatValueNode>(v); }
  ValueNode * string_value(std::string_view v)
  {
    return ast_->create<StringValueNode>(ast_->intern(v));
  }
  ValueNode * bool_value(bool v) { return ast_->create<BooleanValueNode>(v); }
  ValueNode * null_value() { return ast_->create<NullValueNode>(); }
  ValueNode * enum_value(std::string_view name)
  {
    return ast_->create<EnumValueNode>(ast_->intern(name));
  }
  ValueNode * variable(std::string_view name)
  {
    return ast_->create<VariableNode>(ast_->intern(name));
  }

  ValueNode * list(std::initializer_list<ValueNode *> elems)
  {
    return ast_->create<ListValueNode>(ast_->copy_to_arena(std::vector<ValueNode *>(elems)));
  }

  ValueNode * object(std::initializer_list<std::pair<std::string_view, ValueNode *>> fields)
  {
    std::vector<ObjectFieldNode *> nodes;
    for (const auto & [name, value] : fields) {
      nodes.push_back(ast_->create<ObjectFieldNode>(ast_->intern(name), value));
    }
    return ast_->create<ObjectValueNode>(ast_->copy_to_arena(nodes));
  }

  // ===========================================================================
  // Type References
  // ===========================================================================

  TypeRefNode * named_type(std::string_view name)
  {
    return ast_->create<NamedTypeNode>(ast_->intern(name));
  }
  TypeRefNode * list_type(TypeRefNode * of) { return ast_->create<ListTypeNode>(of); }
  TypeRefNode * non_null_type(TypeRefNode * of) { return ast_->create<NonNullTypeNode>(of); }

  // ===========================================================================
  // Operation Structure
  // ===========================================================================

  ArgumentNode * argument(std::string_view name, ValueNode * value)
  {
    return ast_->create<ArgumentNode>(ast_->intern(name), value);
  }

  FieldNode * field(std::string_view name, std::initializer_list<ArgumentNode *> args = {})
  {
    return ast_->create<FieldNode>(
      ast_->intern(name), ast_->copy_to_arena(std::vector<ArgumentNode *>(args)));
  }

  FieldNode * aliased_field(
    std::string_view alias, std::string_view name, std::initializer_list<ArgumentNode *> args = {})
  {
    FieldNode * f = field(name, args);
    f->alias = ast_->intern(alias);
    return f;
  }

  VariableDefinitionNode * variable_definition(
    std::string_view name, TypeRefNode * type, ValueNode * default_value = nullptr)
  {
    return ast_->create<VariableDefinitionNode>(ast_->intern(name), type, default_value);
  }

  /// Anonymous query `{ field ... }`
  OperationNode * query(std::initializer_list<FieldNode *> selections)
  {
    return operation("", {}, selections);
  }

  OperationNode * operation(
    std::string_view name, std::initializer_list<VariableDefinitionNode *> vars,
    std::initializer_list<FieldNode *> selections)
  {
    return ast_->create<OperationNode>(
      ast_->intern(name), ast_->copy_to_arena(std::vector<VariableDefinitionNode *>(vars)),
      ast_->copy_to_arena(std::vector<FieldNode *>(selections)));
  }

private:
  std::unique_ptr<AstContext> ast_;
};

}  // namespace gql_coerce::test_support
