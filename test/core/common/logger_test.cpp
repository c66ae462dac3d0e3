/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using sn::common::createLogger;
using sn::common::parseLogLevel;

/**
 * @given tag
 * @when logger is requested twice
 * @then the same instance is returned
 */
TEST(LoggerTest, SameTagSameLogger) {
  auto first = createLogger("logger_test_same");
  auto second = createLogger("logger_test_same");
  EXPECT_EQ(first, second);
  EXPECT_EQ(first->name(), "logger_test_same");
}

/**
 * @given file sink is set
 * @when new logger is created and logs
 * @then the message reaches the file sink
 */
TEST(LoggerTest, FileSinkAttached) {
  std::ostringstream os;
  sn::common::file_sink =
      std::make_shared<spdlog::sinks::ostream_sink_mt>(os);
  auto logger = createLogger("logger_test_sink");
  sn::common::file_sink.reset();

  logger->info("hello {}", 1);
  logger->flush();
  EXPECT_NE(os.str().find("[logger_test_sink] hello 1"), std::string::npos)
      << os.str();
}

TEST(LoggerTest, ParseLogLevel) {
  EXPECT_EQ(parseLogLevel('e'), spdlog::level::err);
  EXPECT_EQ(parseLogLevel('w'), spdlog::level::warn);
  EXPECT_EQ(parseLogLevel('i'), spdlog::level::info);
  EXPECT_EQ(parseLogLevel('d'), spdlog::level::debug);
  EXPECT_EQ(parseLogLevel('t'), spdlog::level::trace);
  EXPECT_EQ(parseLogLevel('x'), spdlog::level::info);
}
