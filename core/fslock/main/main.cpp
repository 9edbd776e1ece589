/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <system_error>

#include "common/logger.hpp"
#include "fslock/fslock.hpp"
#include "fslock/main/config.hpp"

namespace fl::fslock {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("filelock");
      return logger;
    }

    /** Runs command, returns its exit status */
    int run(const std::vector<std::string> &command) {
      std::vector<char *> argv;
      argv.reserve(command.size() + 1);
      for (const auto &arg : command) {
        argv.push_back(const_cast<char *>(arg.c_str()));
      }
      argv.push_back(nullptr);

      const auto pid{fork()};
      if (pid == -1) {
        log()->error("fork failed, errno={}", errno);
        return EXIT_FAILURE;
      }
      if (pid == 0) {
        execvp(argv[0], argv.data());
        std::cerr << "Cannot execute " << command[0] << ": "
                  << std::generic_category().message(errno) << std::endl;
        _exit(127);
      }

      int status{};
      while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
          log()->error("waitpid failed, errno={}", errno);
          return EXIT_FAILURE;
        }
      }
      if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
      }
      if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
      }
      return EXIT_FAILURE;
    }
  }  // namespace

  int main(const Config &config) {
    FileLock lock{config.folder, config.name, config.lock, log()};
    if (auto res{lock.acquire()}; !res) {
      log()->error("Cannot acquire lockfile '{}': {}",
                   lock.lockPath().string(),
                   res.error().message());
      return EXIT_FAILURE;
    }
    const auto status{run(config.command)};
    lock.release();
    return status;
  }
}  // namespace fl::fslock

int main(int argc, char *argv[]) {
  auto config{fl::fslock::Config::read(argc, argv)};

  spdlog::set_level(config.log_level);
  if (config.log_file) {
    using fl::common::file_sink;
    file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        config.log_file->string());
  }

  return fl::fslock::main(config);
}
