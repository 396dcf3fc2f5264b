/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace fr::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object, shared by every caller with the same tag
   */
  Logger createLogger(const std::string &tag);

  /// Level of every logger, created before or after the call
  void setLogLevel(spdlog::level::level_enum level);
}  // namespace fr::common
