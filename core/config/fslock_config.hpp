/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options.hpp>

#include "fslock/fslock.hpp"

namespace fl::config {
  using boost::program_options::options_description;

  /**
   * Creates program option description for lock retry policy. Parsed values
   * are written to `config` on notify.
   *
   * @param config - destination, must outlive variables_map notification
   * @return lock program option description
   */
  options_description configFileLock(fslock::FileLockConfig &config);
}  // namespace fl::config
