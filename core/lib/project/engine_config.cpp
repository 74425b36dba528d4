// gql_coerce/project/engine_config.cpp - Engine configuration implementation
//
#include "gql_coerce/project/engine_config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <string_view>

#include "gql_coerce/basic/log.hpp"

namespace gql_coerce
{

namespace
{

constexpr std::array<std::string_view, 7> k_log_levels = {
  "trace", "debug", "info", "warn", "error", "critical", "off"};

bool is_known_log_level(const std::string & level)
{
  for (const auto lvl : k_log_levels) {
    if (lvl == level) return true;
  }
  return false;
}

/// Read an optional boolean key; false on a malformed value
bool read_bool(const YAML::Node & section, const char * key, bool & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) return true;
  if (!node.IsScalar()) {
    error = std::string(key) + " must be a boolean";
    return false;
  }
  try {
    out = node.as<bool>();
  } catch (const YAML::Exception &) {
    error = std::string(key) + " must be a boolean";
    return false;
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  EngineConfig config;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(config);
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;

  // Parse 'coercion' section
  if (root["coercion"]) {
    const YAML::Node coercion = root["coercion"];
    if (!coercion.IsMap()) {
      return ConfigLoadResult::fail("coercion must be a map");
    }
    if (!read_bool(
          coercion, "strict_required_arguments", config.coercion.strict_required_arguments,
          error)) {
      return ConfigLoadResult::fail("coercion." + error);
    }
  }

  // Parse 'execution' section
  if (root["execution"]) {
    const YAML::Node execution = root["execution"];
    if (!execution.IsMap()) {
      return ConfigLoadResult::fail("execution must be a map");
    }
    if (!read_bool(execution, "parallel_fields", config.execution.parallel_fields, error)) {
      return ConfigLoadResult::fail("execution." + error);
    }
  }

  // Parse 'logging' section
  if (root["logging"]) {
    const YAML::Node logging = root["logging"];
    if (!logging.IsMap()) {
      return ConfigLoadResult::fail("logging must be a map");
    }
    if (logging["level"]) {
      if (!logging["level"].IsScalar()) {
        return ConfigLoadResult::fail("logging.level must be a string");
      }
      config.logging.level = logging["level"].as<std::string>();
      if (!is_known_log_level(config.logging.level)) {
        return ConfigLoadResult::fail(
          "invalid logging.level: '" + config.logging.level +
          "' (must be one of trace, debug, info, warn, error, critical, off)");
      }
    }
  }

  return ConfigLoadResult::ok(config);
}

}  // namespace

ConfigLoadResult load_engine_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_root(root);
}

ConfigLoadResult parse_engine_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_root(root);
}

std::optional<std::filesystem::path> find_engine_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_engine_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

void apply_log_level(const EngineConfig & config)
{
  const auto level = spdlog::level::from_str(config.logging.level);
  spdlog::set_level(level);
  logger()->set_level(level);
}

}  // namespace gql_coerce
