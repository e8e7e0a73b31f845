/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ferry::common {
  spdlog::sink_ptr file_sink;

  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard lock{mutex};
    auto logger{spdlog::get(tag)};
    if (logger) {
      return logger;
    }
    logger = spdlog::stdout_color_mt(tag);
    if (file_sink) {
      logger->sinks().push_back(file_sink);
    }
    return logger;
  }

  spdlog::level::level_enum logLevelFromChar(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }
}  // namespace ferry::common
