// gql_coerce/project/engine_config.hpp - Engine configuration (gql_coerce.yaml)
//
// Parses and validates the engine's YAML configuration file.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace gql_coerce
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Coercion section.
 */
struct CoercionConfig
{
  /// Report ValueRequired for a non-null argument omitted from the query
  /// text with no default, instead of leaving it to the resolver
  bool strict_required_arguments = false;
};

/**
 * Execution section.
 */
struct ExecutionConfig
{
  /// Coerce and resolve root fields concurrently
  bool parallel_fields = false;
};

/**
 * Logging section.
 */
struct LoggingConfig
{
  /// trace | debug | info | warn | error | critical | off
  std::string level = "warn";
};

/**
 * Complete engine configuration (gql_coerce.yaml).
 */
struct EngineConfig
{
  CoercionConfig coercion;
  ExecutionConfig execution;
  LoggingConfig logging;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  EngineConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(EngineConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load engine configuration from a YAML file.
 *
 * Missing sections and keys keep their defaults.
 */
[[nodiscard]] ConfigLoadResult load_engine_config(const std::filesystem::path & config_path);

/**
 * Parse engine configuration from YAML text.
 */
[[nodiscard]] ConfigLoadResult parse_engine_config(const std::string & yaml_text);

/**
 * Search for gql_coerce.yaml from start_dir upward to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_engine_config(
  const std::filesystem::path & start_dir);

/**
 * Set the global spdlog level and the engine logger's level from
 * config.logging.level.
 */
void apply_log_level(const EngineConfig & config);

/// Default name of the engine configuration file.
inline constexpr const char * k_engine_config_file_name = "gql_coerce.yaml";

}  // namespace gql_coerce
