// gql_coerce/exec/executor.cpp - Root field execution
//
#include "gql_coerce/exec/executor.hpp"

#include <fmt/core.h>
#include <spdlog/logger.h>

#include <any>
#include <exception>
#include <future>
#include <utility>

#include "gql_coerce/ast/ast_context.hpp"
#include "gql_coerce/basic/casting.hpp"
#include "gql_coerce/basic/log.hpp"
#include "gql_coerce/coerce/argument_coercer.hpp"

namespace gql_coerce
{

nlohmann::json ExecutionResult::to_json() const
{
  nlohmann::json out;
  out["data"] = data;
  if (!errors.empty()) {
    nlohmann::json errs = nlohmann::json::array();
    for (const auto & e : errors) {
      errs.push_back(e.to_json());
    }
    out["errors"] = std::move(errs);
  }
  return out;
}

std::string format_type_ref(const TypeRefNode * node)
{
  if (const auto * named = dyn_cast<NamedTypeNode>(node)) {
    return std::string(named->name);
  }
  if (const auto * list = dyn_cast<ListTypeNode>(node)) {
    return "[" + format_type_ref(list->of_type) + "]";
  }
  if (const auto * non_null = dyn_cast<NonNullTypeNode>(node)) {
    return format_type_ref(non_null->of_type) + "!";
  }
  return "<missing>";
}

Executor::Executor(const Schema & schema, EngineConfig config)
: schema_(schema), config_(std::move(config))
{
}

// ============================================================================
// Entry Point
// ============================================================================

ExecutionResult Executor::execute(
  const OperationNode & operation, const nlohmann::json & variables) const
{
  // Request-local; the schema's type graph stays untouched.
  WrapperTypeTable declared_wrappers;
  const VariableResolver resolver(
    resolve_variable_definitions(operation, declared_wrappers), variables);

  std::vector<FieldOutcome> outcomes;
  outcomes.reserve(operation.selections.size());

  if (config_.execution.parallel_fields && operation.selections.size() > 1) {
    std::vector<std::future<FieldOutcome>> pending;
    pending.reserve(operation.selections.size());
    for (const auto * field : operation.selections) {
      pending.push_back(std::async(std::launch::async, [this, field, &resolver]() {
        return execute_field(*field, resolver);
      }));
    }
    for (auto & f : pending) {
      outcomes.push_back(f.get());
    }
  } else {
    for (const auto * field : operation.selections) {
      outcomes.push_back(execute_field(*field, resolver));
    }
  }

  ExecutionResult result;
  for (auto & outcome : outcomes) {
    if (outcome.error) {
      result.errors.push_back(std::move(*outcome.error));
    } else if (outcome.data) {
      result.data[outcome.key] = std::move(*outcome.data);
    }
  }
  return result;
}

// ============================================================================
// Variables
// ============================================================================

std::vector<VariableDefinition> Executor::resolve_variable_definitions(
  const OperationNode & operation, WrapperTypeTable & declared_wrappers) const
{
  std::vector<VariableDefinition> defs;
  defs.reserve(operation.variable_definitions.size());

  for (const auto * node : operation.variable_definitions) {
    VariableDefinition def;
    def.name = node->name;
    def.type = resolve_type_ref(node->type, declared_wrappers);
    def.type_name = format_type_ref(node->type);
    def.default_value = node->default_value;
    if (def.type == nullptr) {
      logger()->debug("variable `${}' declares unknown type `{}'", def.name, def.type_name);
    }
    defs.push_back(std::move(def));
  }
  return defs;
}

const Type * Executor::resolve_type_ref(
  const TypeRefNode * node, WrapperTypeTable & declared_wrappers) const
{
  if (const auto * named = dyn_cast<NamedTypeNode>(node)) {
    return schema_.types().lookup(named->name);
  }
  if (const auto * list = dyn_cast<ListTypeNode>(node)) {
    const Type * inner = resolve_type_ref(list->of_type, declared_wrappers);
    return inner != nullptr ? declared_wrappers.list_of(inner) : nullptr;
  }
  if (const auto * non_null = dyn_cast<NonNullTypeNode>(node)) {
    const Type * inner = resolve_type_ref(non_null->of_type, declared_wrappers);
    return inner != nullptr ? declared_wrappers.non_null_of(inner) : nullptr;
  }
  return nullptr;
}

// ============================================================================
// Field Execution
// ============================================================================

Executor::FieldOutcome Executor::execute_field(
  const FieldNode & node, const VariableResolver & variables) const
{
  FieldOutcome outcome;
  outcome.key = std::string(node.response_key());

  const FieldDef * def = schema_.find_query_field(node.name);
  if (def == nullptr) {
    outcome.error = report(node.name, "field is not defined on the query type");
    logger()->warn("{}", outcome.error->message);
    return outcome;
  }

  // Each field gets its own arena and failure bag so fields can run in
  // parallel and fail independently.
  AstContext scratch;
  FailureBag failures;
  ArgumentCoercer coercer(
    scratch, failures, &variables,
    CoercionOptions{config_.coercion.strict_required_arguments});

  logger()->debug("coercing arguments of field `{}'", def->name);
  const ArgumentMap args = coercer.coerce_arguments(*def, node);

  if (!failures.empty()) {
    outcome.error = report(node.name, failures);
    logger()->warn("{}", outcome.error->message);
    return outcome;
  }

  if (!def->resolve) {
    outcome.error = report(node.name, "field has no resolver");
    logger()->error("{}", outcome.error->message);
    return outcome;
  }

  ResolveResult resolved;
  try {
    resolved = def->resolve(args);
  } catch (const std::exception & e) {
    outcome.error = report(node.name, fmt::format("resolver failed: {}", e.what()));
    logger()->error("{}", outcome.error->message);
    return outcome;
  }
  if (!resolved.success) {
    outcome.error = report(node.name, resolved.error);
    if (resolved.kind) {
      logger()->warn("{} [{}]", outcome.error->message, to_string(*resolved.kind));
    } else {
      logger()->warn("{}", outcome.error->message);
    }
    return outcome;
  }

  nlohmann::json data;
  std::string error;
  if (!serialize(def->type, resolved.value, data, error)) {
    outcome.error = report(node.name, error);
    logger()->error("{}", outcome.error->message);
    return outcome;
  }

  outcome.data = std::move(data);
  return outcome;
}

bool Executor::serialize(
  const Type * type, const Value & value, nlohmann::json & out, std::string & error) const
{
  if (type->is_non_null()) {
    if (value.is_null() || value.is_absent()) {
      error = fmt::format("non-null type `{}' resolved to null", type->display_name());
      return false;
    }
    return serialize(type->of_type, value, out, error);
  }

  if (value.is_null() || value.is_absent()) {
    out = nullptr;
    return true;
  }

  switch (type->kind) {
    case TypeKind::List: {
      if (!value.is_list()) {
        error = fmt::format("expected a list value for type `{}'", type->display_name());
        return false;
      }
      out = nlohmann::json::array();
      for (const auto & elem : value.as_list()) {
        nlohmann::json item;
        if (!serialize(type->of_type, elem, item, error)) return false;
        out.push_back(std::move(item));
      }
      return true;
    }

    case TypeKind::Scalar:
      if (!value.is_scalar()) {
        error = fmt::format("expected a scalar value for type `{}'", type->name);
        return false;
      }
      try {
        out = type->serialize(value.scalar());
      } catch (const std::bad_any_cast &) {
        error = fmt::format("could not serialize value as `{}'", type->name);
        return false;
      } catch (const std::exception & e) {
        error = fmt::format("could not serialize value as `{}': {}", type->name, e.what());
        return false;
      }
      return true;

    case TypeKind::Enum:
      if (!value.is_enum() || !type->has_enum_value(value.enum_symbol())) {
        error = fmt::format("expected a member of enum `{}'", type->name);
        return false;
      }
      out = value.enum_symbol();
      return true;

    case TypeKind::InputObject:
      error = fmt::format("input object type `{}' cannot be used as a field type", type->name);
      return false;

    case TypeKind::NonNull:
      break;
  }

  error = fmt::format("unsupported field type `{}'", type->display_name());
  return false;
}

}  // namespace gql_coerce
