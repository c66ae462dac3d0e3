/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SAVENOTICE_CORE_MESSAGE_SAVE_ERROR_HPP
#define SAVENOTICE_CORE_MESSAGE_SAVE_ERROR_HPP

#include <string>
#include <string_view>

#include "common/outcome.hpp"

namespace sn::message {

  /**
   * @brief Why a save failed, as classified by the caller
   */
  enum class SaveError {
    kFileLocked = 1,
    kWriteFailed,
  };

  /**
   * @brief user text for a failed save
   * @param ec - failure reason, SaveError::kFileLocked gives
   * fileLockedMessage()
   * @param path - file that was being saved
   * @return text to show to the user
   */
  std::string saveFailureMessage(const std::error_code &ec,
                                 std::string_view path);

  /**
   * @brief same as saveFailureMessage(), also logs a warning on "save" logger
   */
  std::string reportSaveFailure(const std::error_code &ec,
                                std::string_view path);

}  // namespace sn::message

OUTCOME_HPP_DECLARE_ERROR(sn::message, SaveError);

#endif  // SAVENOTICE_CORE_MESSAGE_SAVE_ERROR_HPP
