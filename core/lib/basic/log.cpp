// gql_coerce/basic/log.cpp - Engine logger
//
#include "gql_coerce/basic/log.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <string>
#include <utility>

namespace gql_coerce
{

namespace
{

std::shared_ptr<spdlog::logger> make_silent_logger()
{
  auto silent = std::make_shared<spdlog::logger>(
    std::string(k_logger_name), std::make_shared<spdlog::sinks::null_sink_mt>());
  silent->set_level(spdlog::get_level());
  return silent;
}

struct LoggerSlot
{
  std::mutex mutex;
  std::shared_ptr<spdlog::logger> current;
};

LoggerSlot & slot()
{
  static LoggerSlot instance;
  return instance;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger()
{
  LoggerSlot & s = slot();
  const std::lock_guard<std::mutex> lock(s.mutex);
  if (!s.current) {
    s.current = spdlog::get(k_logger_name);
    if (!s.current) {
      s.current = make_silent_logger();
    }
  }
  return s.current;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement)
{
  LoggerSlot & s = slot();
  const std::lock_guard<std::mutex> lock(s.mutex);
  s.current = replacement ? std::move(replacement) : make_silent_logger();
}

}  // namespace gql_coerce
