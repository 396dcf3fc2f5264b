/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace fr::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e %n %^%L%$ %v"};

    struct Registry {
      std::mutex mutex;
      spdlog::level::level_enum level{spdlog::level::info};
    };

    Registry &registry() {
      static Registry registry;
      return registry;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    auto &reg{registry()};
    std::lock_guard lock{reg.mutex};
    auto logger{spdlog::get(tag)};
    if (logger == nullptr) {
      // stderr keeps stdout free for simulator reports
      logger = spdlog::stderr_color_mt(tag);
      logger->set_pattern(kPattern);
      logger->set_level(reg.level);
    }
    return logger;
  }

  void setLogLevel(spdlog::level::level_enum level) {
    auto &reg{registry()};
    std::lock_guard lock{reg.mutex};
    reg.level = level;
    spdlog::apply_all(
        [level](const Logger &logger) { logger->set_level(level); });
  }
}  // namespace fr::common
