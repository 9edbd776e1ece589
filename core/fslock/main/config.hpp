/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <string>
#include <vector>

#include "common/logger.hpp"
#include "fslock/fslock.hpp"

namespace fl::fslock {
  /**
   * Command line of filelock utility
   */
  struct Config {
    boost::filesystem::path folder;
    std::string name;
    FileLockConfig lock;
    spdlog::level::level_enum log_level;
    boost::optional<boost::filesystem::path> log_file;
    /** Program and arguments to run while lock is held */
    std::vector<std::string> command;

    static Config read(int argc, char **argv);
  };

  spdlog::level::level_enum getLogLevel(char level);
}  // namespace fl::fslock
