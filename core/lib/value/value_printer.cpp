// gql_coerce/value/value_printer.cpp - Value rendering
#include "gql_coerce/value/value_printer.hpp"

#include <fmt/core.h>

#include <cstdint>

namespace gql_coerce
{

namespace
{

std::string quote(std::string_view s) { return nlohmann::json(std::string(s)).dump(); }

std::string_view kind_name(RawValueKind kind)
{
  switch (kind) {
    case RawValueKind::Int:
      return "int";
    case RawValueKind::Float:
      return "float";
    case RawValueKind::String:
      return "string";
    case RawValueKind::Boolean:
      return "boolean";
    case RawValueKind::Enum:
      return "enum";
    case RawValueKind::List:
      return "list";
    case RawValueKind::Object:
      return "object";
    case RawValueKind::Null:
      return "null";
    case RawValueKind::Variable:
      return "variable";
    case RawValueKind::Absent:
      return "absent";
  }
  return "unknown";
}

std::string inspect_scalar(const std::any & payload)
{
  if (const auto * i = std::any_cast<int64_t>(&payload)) return std::to_string(*i);
  if (const auto * i = std::any_cast<int>(&payload)) return std::to_string(*i);
  if (const auto * d = std::any_cast<double>(&payload)) return fmt::format("{}", *d);
  if (const auto * b = std::any_cast<bool>(&payload)) return *b ? "true" : "false";
  if (const auto * s = std::any_cast<std::string>(&payload)) return quote(*s);
  return "#<scalar>";
}

}  // namespace

std::string print_raw(const RawValue & raw)
{
  switch (raw.kind()) {
    case RawValueKind::Int:
      return std::to_string(raw.as_int());
    case RawValueKind::Float:
      return fmt::format("{}", raw.as_float());
    case RawValueKind::String:
      return quote(raw.as_string());
    case RawValueKind::Boolean:
      return raw.as_boolean() ? "true" : "false";
    case RawValueKind::Enum:
      return std::string(raw.enum_name());
    case RawValueKind::List: {
      std::string out = "[";
      bool first = true;
      for (const auto & elem : raw.as_list()) {
        if (!first) out += ", ";
        first = false;
        out += print_raw(elem);
      }
      out += "]";
      return out;
    }
    case RawValueKind::Object: {
      std::string out = "{";
      bool first = true;
      for (const auto & field : raw.as_object()) {
        if (!first) out += ", ";
        first = false;
        out += fmt::format("{}: {}", field.name, print_raw(field.value));
      }
      out += "}";
      return out;
    }
    case RawValueKind::Null:
      return "null";
    case RawValueKind::Variable:
      return fmt::format("${}", raw.variable_name());
    case RawValueKind::Absent:
      return "<absent>";
  }
  return "<unknown>";
}

std::string inspect(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Absent:
      return "<absent>";
    case ValueKind::Null:
      return "nil";
    case ValueKind::Scalar:
      return inspect_scalar(value.scalar());
    case ValueKind::Enum:
      return value.enum_symbol();
    case ValueKind::List: {
      std::string out = "[";
      bool first = true;
      for (const auto & elem : value.as_list()) {
        if (!first) out += ", ";
        first = false;
        out += inspect(elem);
      }
      out += "]";
      return out;
    }
    case ValueKind::Object: {
      std::string out = "%{";
      for (size_t i = 0; i < value.keys().size(); ++i) {
        if (i != 0) out += ", ";
        out += fmt::format("{}: {}", value.keys()[i], inspect(value.entry(i)));
      }
      out += "}";
      return out;
    }
  }
  return "<unknown>";
}

nlohmann::json to_json(const RawValue & raw)
{
  nlohmann::json j;
  j["kind"] = std::string(kind_name(raw.kind()));

  switch (raw.kind()) {
    case RawValueKind::Int:
      j["value"] = raw.as_int();
      break;
    case RawValueKind::Float:
      j["value"] = raw.as_float();
      break;
    case RawValueKind::String:
      j["value"] = std::string(raw.as_string());
      break;
    case RawValueKind::Boolean:
      j["value"] = raw.as_boolean();
      break;
    case RawValueKind::Enum:
      j["value"] = std::string(raw.enum_name());
      break;
    case RawValueKind::Variable:
      j["name"] = std::string(raw.variable_name());
      break;
    case RawValueKind::List: {
      nlohmann::json elems = nlohmann::json::array();
      for (const auto & elem : raw.as_list()) {
        elems.push_back(to_json(elem));
      }
      j["elements"] = std::move(elems);
      break;
    }
    case RawValueKind::Object: {
      nlohmann::json fields = nlohmann::json::array();
      for (const auto & field : raw.as_object()) {
        fields.push_back({{"name", std::string(field.name)}, {"value", to_json(field.value)}});
      }
      j["fields"] = std::move(fields);
      break;
    }
    case RawValueKind::Null:
    case RawValueKind::Absent:
      break;
  }
  return j;
}

}  // namespace gql_coerce
