/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
  constexpr auto kPattern{"[%Y-%m-%d %H:%M:%S][th:%t][%l][%n] %v"};

  std::shared_ptr<spdlog::logger> makeLogger(const std::string &tag) {
    auto logger = spdlog::stdout_color_mt(tag);
    if (sn::common::file_sink) {
      logger->sinks().push_back(sn::common::file_sink);
    }
    logger->set_pattern(kPattern);
    return logger;
  }
}  // namespace

namespace sn::common {
  spdlog::sink_ptr file_sink;

  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = makeLogger(tag);
    }
    return logger;
  }

  spdlog::level::level_enum parseLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
      default:
        return spdlog::level::info;
    }
  }
}  // namespace sn::common
