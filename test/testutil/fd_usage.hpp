/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/operations.hpp>
#include <iterator>

namespace test {
  /// Number of fds opened by the current process, including the one used to
  /// list them
  inline size_t fdUsage() {
    return static_cast<size_t>(std::distance(
        boost::filesystem::directory_iterator{"/proc/self/fd"}, {}));
  }
}  // namespace test
