/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "message/save_error.hpp"

#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"
#include "message/file_locked_message.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sn::message, SaveError, e) {
  using sn::message::SaveError;

  switch (e) {
    case (SaveError::kFileLocked):
      return "SaveError: file is open in another program";
    case (SaveError::kWriteFailed):
      return "SaveError: file could not be written";
    default:
      return "SaveError: unknown error";
  }
}

namespace sn::message {
  std::string saveFailureMessage(const std::error_code &ec,
                                 std::string_view path) {
    if (ec == SaveError::kFileLocked) {
      return fileLockedMessage(path);
    }
    return fmt::format("Failed to save file \"{}\": {}", path, ec.message());
  }

  std::string reportSaveFailure(const std::error_code &ec,
                                std::string_view path) {
    static common::Logger logger = common::createLogger("save");
    logger->warn("{}: {:#}", path, ec);
    return saveFailureMessage(ec, path);
  }
}  // namespace sn::message
