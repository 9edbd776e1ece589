/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fslock/fslock_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(fl::fslock, FileLockError, e) {
  using fl::fslock::FileLockError;

  switch (e) {
    case (FileLockError::kTimeout):
      return "FileLock: timeout occurred waiting for lock file";
    case (FileLockError::kCancelled):
      return "FileLock: acquisition cancelled";
    default:
      return "FileLock: unknown error";
  }
}
