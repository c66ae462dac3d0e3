/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace sn::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Extra sink attached to every logger created after it is set
   */
  extern spdlog::sink_ptr file_sink;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Map one-letter log level [e,w,i,d,t] to spdlog level, info by default
   */
  spdlog::level::level_enum parseLogLevel(char level);
}  // namespace sn::common
