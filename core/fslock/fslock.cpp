/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fslock/fslock.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

#include "clock/impl/steady_clock_impl.hpp"
#include "fslock/fslock_error.hpp"

namespace fl::fslock {
  bool isContention(int error, const FileLockConfig &config) {
    if (error == EEXIST) {
      return true;
    }
    return error == EACCES && config.permission_denied_is_contention;
  }

  FileLock::FileLock(const path &folder,
                     const std::string &name,
                     FileLockConfig config,
                     common::Logger logger,
                     std::shared_ptr<clock::SteadyClock> clock)
      : lock_path_{folder / (name + kLockFileExtension)},
        config_{config},
        logger_{std::move(logger)},
        clock_{std::move(clock)} {
    if (clock_ == nullptr) {
      clock_ = std::make_shared<clock::SteadyClockImpl>();
    }
  }

  FileLock::~FileLock() {
    release();
  }

  const path &FileLock::lockPath() const {
    return lock_path_;
  }

  const FileLockConfig &FileLock::config() const {
    return config_;
  }

  bool FileLock::isLocked() const {
    return fd_ != -1;
  }

  outcome::result<void> FileLock::acquire() {
    return acquireImpl(nullptr);
  }

  outcome::result<void> FileLock::acquire(const std::atomic_bool &cancel) {
    return acquireImpl(&cancel);
  }

  outcome::result<void> FileLock::acquireImpl(const std::atomic_bool *cancel) {
    if (isLocked()) {
      return outcome::success();
    }
    const auto start{clock_->nowMicro()};
    while (true) {
      // creation and existence check must be single syscall
      const auto fd{::open(lock_path_.c_str(),
                           O_CREAT | O_EXCL | O_RDWR | O_CLOEXEC,
                           0666)};
      if (fd != -1) {
        fd_ = fd;
        if (logger_) {
          logger_->debug("Worker '{}' lock acquire '{}'",
                         ::getpid(),
                         lock_path_.string());
        }
        return outcome::success();
      }
      const auto error{errno};
      if (error == EINTR) {
        continue;
      }
      if (!isContention(error, config_)) {
        if (logger_) {
          logger_->error("Cannot create lockfile '{}', errno={}",
                         lock_path_.string(),
                         error);
        }
        return std::error_code{error, std::generic_category()};
      }

      const auto elapsed{
          std::chrono::duration_cast<milliseconds>(clock_->nowMicro() - start)};
      if (elapsed >= config_.timeout) {
        if (logger_) {
          logger_->warn("Timeout occurred for lockfile '{}'",
                        lock_path_.string());
        }
        return FileLockError::kTimeout;
      }
      if (cancel != nullptr && cancel->load()) {
        return FileLockError::kCancelled;
      }

      const auto delay{retryDelay()};
      if (logger_) {
        logger_->trace("Waiting for another worker. Retry after '{}' ms",
                       delay.count());
      }
      std::this_thread::sleep_for(delay);
    }
  }

  void FileLock::release() {
    if (!isLocked()) {
      return;
    }
    struct stat held {};
    const auto held_known{::fstat(fd_, &held) == 0};
    if (::close(fd_) != 0 && logger_) {
      logger_->warn("Cannot close lockfile '{}', errno={}",
                    lock_path_.string(),
                    errno);
    }
    fd_ = -1;

    // path may have been removed and recreated by another holder meanwhile
    struct stat current {};
    if (::stat(lock_path_.c_str(), &current) != 0) {
      if (logger_) {
        logger_->warn("Lockfile '{}' is gone before release, errno={}",
                      lock_path_.string(),
                      errno);
      }
    } else if (!held_known || current.st_dev != held.st_dev
               || current.st_ino != held.st_ino) {
      if (logger_) {
        logger_->warn("Lockfile '{}' is owned by another holder, not removed",
                      lock_path_.string());
      }
    } else if (::unlink(lock_path_.c_str()) != 0 && logger_) {
      logger_->warn("Cannot remove lockfile '{}', errno={}",
                    lock_path_.string(),
                    errno);
    }
    if (logger_) {
      logger_->debug(
          "Worker '{}' lock release '{}'", ::getpid(), lock_path_.string());
    }
  }

  milliseconds FileLock::retryDelay() {
    if (config_.retry_jitter.count() <= 0) {
      return config_.retry_delay;
    }
    if (!jitter_random_) {
      // seeded from pid and time, without entropy device
      std::seed_seq seed{
          static_cast<long>(::getpid()),
          static_cast<long>(
              std::chrono::steady_clock::now().time_since_epoch().count())};
      jitter_random_.emplace(seed);
    }
    std::uniform_int_distribution<milliseconds::rep> jitter{
        0, config_.retry_jitter.count()};
    return config_.retry_delay + milliseconds{jitter(*jitter_random_)};
  }

  FileLockGuard::FileLockGuard(FileLock &lock) : lock_{lock} {
    if (lock_.isLocked()) {
      return;
    }
    if (auto res{lock_.acquire()}; !res) {
      outcome::raise(res.error(),
                     "lockfile '" + lock_.lockPath().string() + "'");
    }
    acquired_ = true;
  }

  FileLockGuard::~FileLockGuard() {
    if (acquired_) {
      lock_.release();
    }
  }
}  // namespace fl::fslock
