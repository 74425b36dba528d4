// tests/unit/basic/test_log.cpp - Unit tests for the engine logger
//

#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

#include "gql_coerce/basic/log.hpp"
#include "gql_coerce/exec/executor.hpp"
#include "gql_coerce/test_support/query_builder.hpp"

using namespace gql_coerce;
using gql_coerce::test_support::QueryBuilder;

namespace
{

/// Installs a ring-buffer engine logger for the duration of a test
struct CapturedLog
{
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink =
    std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);

  CapturedLog()
  {
    auto captured = std::make_shared<spdlog::logger>("captured", sink);
    captured->set_level(spdlog::level::trace);
    captured->set_pattern("[%l] %v");
    set_logger(captured);
  }

  ~CapturedLog() { set_logger(nullptr); }
};

}  // namespace

TEST(BasicLog, DefaultLoggerIsNamedAndNotTheDefault)
{
  const auto engine = logger();
  ASSERT_NE(engine, nullptr);
  EXPECT_EQ(engine->name(), k_logger_name);
  EXPECT_NE(engine, spdlog::default_logger());
}

TEST(BasicLog, ExecutorLogsThroughEngineLogger)
{
  CapturedLog log;
  Schema schema;
  QueryBuilder q;

  const ExecutionResult result = Executor(schema).execute(*q.query({q.field("missing")}));
  ASSERT_EQ(result.errors.size(), 1u);

  const auto lines = log.sink->last_formatted();
  ASSERT_FALSE(lines.empty());
  EXPECT_NE(
    lines.back().find("[warning] Field `missing': field is not defined on the query type"),
    std::string::npos);
}

TEST(BasicLog, ResettingRestoresSilentLogger)
{
  {
    CapturedLog log;
    EXPECT_EQ(logger()->name(), "captured");
  }
  EXPECT_EQ(logger()->name(), k_logger_name);
}
