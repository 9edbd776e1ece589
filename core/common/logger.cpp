/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fl::common {
  spdlog::sink_ptr file_sink;

  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard lock{mutex};
    auto logger{spdlog::get(tag)};
    if (logger == nullptr) {
      logger = spdlog::stderr_color_mt(tag);
      if (file_sink) {
        logger->sinks().push_back(file_sink);
      }
    }
    return logger;
  }
}  // namespace fl::common
