/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SAVENOTICE_CORE_MESSAGE_FILE_LOCKED_MESSAGE_HPP
#define SAVENOTICE_CORE_MESSAGE_FILE_LOCKED_MESSAGE_HPP

#include <string>
#include <string_view>

namespace sn::message {

  /**
   * @brief message for a file that could not be saved because another
   * program holds it open
   * @param path of the file, inserted verbatim
   * @return multi-line text asking to close the file and try again
   */
  std::string fileLockedMessage(std::string_view path);

  /**
   * @brief short notice for the same condition when the file name is not
   * known
   */
  std::string fileBusyNotice();

}  // namespace sn::message

#endif  // SAVENOTICE_CORE_MESSAGE_FILE_LOCKED_MESSAGE_HPP
