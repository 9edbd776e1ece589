/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef FILELOCK_CORE_FSLOCK_HPP
#define FILELOCK_CORE_FSLOCK_HPP

#include <atomic>
#include <boost/filesystem/path.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "clock/steady_clock.hpp"
#include "common/logger.hpp"
#include "common/outcome.hpp"

namespace fl::fslock {
  using boost::filesystem::path;
  using std::chrono::milliseconds;

  /** Lock file name suffix */
  constexpr auto kLockFileExtension{".lock"};

  struct FileLockConfig {
    /** Max time to keep retrying acquisition */
    milliseconds timeout{std::chrono::seconds{300}};
    /** Sleep between failed attempts */
    milliseconds retry_delay{100};
    /** Upper bound of random delay added to each retry */
    milliseconds retry_jitter{0};
    /** Retry on EACCES like on EEXIST, otherwise report it as io error */
    bool permission_denied_is_contention{true};
  };

  /**
   * Whether open(2) errno means the lock file is owned by someone else.
   * @param error - errno of failed exclusive create
   * @param config - lock config
   */
  bool isContention(int error, const FileLockConfig &config);

  /**
   * Cross-process advisory lock. Lock is held while "<folder>/<name>.lock"
   * exists, the file is created exclusively by the owner and removed on
   * release. Instance must be used by single thread.
   */
  class FileLock {
   public:
    /**
     * Does no io
     * @param folder - existing directory for lock file
     * @param name - filesystem safe lock name
     * @param config - retry policy
     * @param logger - diagnostics sink, null to disable
     * @param clock - monotonic clock, null for real one
     */
    FileLock(const path &folder,
             const std::string &name,
             FileLockConfig config = {},
             common::Logger logger = nullptr,
             std::shared_ptr<clock::SteadyClock> clock = nullptr);

    FileLock(const FileLock &) = delete;
    FileLock(FileLock &&) = delete;
    FileLock &operator=(const FileLock &) = delete;
    FileLock &operator=(FileLock &&) = delete;

    ~FileLock();

    const path &lockPath() const;

    const FileLockConfig &config() const;

    bool isLocked() const;

    /**
     * Creates lock file, retrying while it is owned by someone else.
     * Does nothing if already locked by this instance.
     * @return FileLockError::kTimeout if not acquired in time, or errno code
     * on filesystem error
     */
    outcome::result<void> acquire();

    /**
     * Same as acquire(), additionally fails with FileLockError::kCancelled
     * when `cancel` becomes true between retries
     */
    outcome::result<void> acquire(const std::atomic_bool &cancel);

    /**
     * Closes and removes lock file. Does nothing if not locked.
     * File is left in place if path no longer refers to the file created by
     * this instance. Filesystem errors are logged, lock is considered
     * released anyway.
     */
    void release();

   private:
    outcome::result<void> acquireImpl(const std::atomic_bool *cancel);

    milliseconds retryDelay();

    path lock_path_;
    FileLockConfig config_;
    common::Logger logger_;
    std::shared_ptr<clock::SteadyClock> clock_;
    /** Seeded on first jittered retry */
    std::optional<std::minstd_rand> jitter_random_;
    int fd_{-1};
  };

  /**
   * Holds lock for scope. Acquires on construction unless lock is already
   * held, releases on destruction if it was acquired by this guard.
   * Throws std::system_error naming lock file if acquisition fails.
   */
  class FileLockGuard {
   public:
    explicit FileLockGuard(FileLock &lock);

    FileLockGuard(const FileLockGuard &) = delete;
    FileLockGuard &operator=(const FileLockGuard &) = delete;

    ~FileLockGuard();

   private:
    FileLock &lock_;
    bool acquired_{false};
  };

}  // namespace fl::fslock

#endif  // FILELOCK_CORE_FSLOCK_HPP
