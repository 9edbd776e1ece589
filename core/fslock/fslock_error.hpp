/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef FILELOCK_CORE_FSLOCK_FSLOCK_ERROR_HPP
#define FILELOCK_CORE_FSLOCK_FSLOCK_ERROR_HPP

#include "common/outcome.hpp"

namespace fl::fslock {

  /**
   * @brief FileLock returns these types of errors.
   * Filesystem faults are reported with std::generic_category() codes.
   */
  enum class FileLockError {
    kTimeout = 1,
    kCancelled,
  };

}  // namespace fl::fslock

OUTCOME_HPP_DECLARE_ERROR(fl::fslock, FileLockError);

#endif  // FILELOCK_CORE_FSLOCK_FSLOCK_ERROR_HPP
