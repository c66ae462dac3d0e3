/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "message/file_locked_message.hpp"

#include <spdlog/fmt/fmt.h>

namespace sn::message {
  namespace {
    constexpr auto kFileLockedTemplate{
        "\n"
        "File Save Error\n"
        "\n"
        "The file could not be saved because it is currently open in another "
        "program.\n"
        "\n"
        "Please close the file \"{}\" and try again.\n"};

    constexpr auto kFileBusyNotice{
        "File in Use - The file is currently open in another program.\n"
        "Please close the file and try again."};
  }  // namespace

  std::string fileLockedMessage(std::string_view path) {
    return fmt::format(kFileLockedTemplate, path);
  }

  std::string fileBusyNotice() {
    return kFileBusyNotice;
  }
}  // namespace sn::message
