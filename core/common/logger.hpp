/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace ferry::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /// Optional sink shared by every logger created afterwards
  extern spdlog::sink_ptr file_sink;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Maps a one-letter command line level to spdlog level
   * @param level - one of [e,w,i,d,t], anything else is info
   */
  spdlog::level::level_enum logLevelFromChar(char level);
}  // namespace ferry::common
