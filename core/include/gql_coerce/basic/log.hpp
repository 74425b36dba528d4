// gql_coerce/basic/log.hpp - Engine logger
//
// Library code logs through the logger named "gql_coerce" and never through
// spdlog's default logger. Until the embedding program registers or installs
// one with sinks of its choosing, messages are discarded.
//
#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace gql_coerce
{

inline constexpr const char * k_logger_name = "gql_coerce";

/// Logger used by the engine. Picks up a logger registered under
/// k_logger_name when first called; otherwise a silent one.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Replace the engine logger (nullptr restores the silent one).
void set_logger(std::shared_ptr<spdlog::logger> replacement);

}  // namespace gql_coerce
