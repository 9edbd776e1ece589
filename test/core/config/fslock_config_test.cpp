/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/fslock_config.hpp"

#include <gtest/gtest.h>
#include <sstream>

using fl::config::configFileLock;
using fl::fslock::FileLockConfig;
using namespace std::chrono_literals;
namespace po = boost::program_options;

namespace {
  FileLockConfig parse(std::vector<const char *> args) {
    FileLockConfig config;
    auto desc{configFileLock(config)};
    args.insert(args.begin(), "filelock");
    po::variables_map vm;
    po::store(po::parse_command_line(
                  static_cast<int>(args.size()), args.data(), desc),
              vm);
    po::notify(vm);
    return config;
  }
}  // namespace

/**
 * @given no lock options
 * @when parsed
 * @then defaults are 300s timeout, 0.1s retry delay, no jitter, EACCES retried
 */
TEST(FileLockConfigTest, Defaults) {
  const auto config{parse({})};
  EXPECT_EQ(config.timeout, 300s);
  EXPECT_EQ(config.retry_delay, 100ms);
  EXPECT_EQ(config.retry_jitter, 0ms);
  EXPECT_TRUE(config.permission_denied_is_contention);
}

/**
 * @given all lock options in seconds
 * @when parsed
 * @then config holds them rounded to milliseconds
 */
TEST(FileLockConfigTest, CommandLine) {
  const auto config{parse({"--lock-timeout",
                           "1",
                           "--lock-retry-delay",
                           "0.29",
                           "--lock-retry-jitter",
                           "0.05",
                           "--lock-strict-permissions"})};
  EXPECT_EQ(config.timeout, 1s);
  EXPECT_EQ(config.retry_delay, 290ms);
  EXPECT_EQ(config.retry_jitter, 50ms);
  EXPECT_FALSE(config.permission_denied_is_contention);
}

/**
 * @given lock options in config file
 * @when parsed
 * @then config holds them
 */
TEST(FileLockConfigTest, ConfigFile) {
  FileLockConfig config;
  auto desc{configFileLock(config)};
  std::istringstream file{"lock-timeout=2.5\nlock-retry-delay=0.01\n"};
  po::variables_map vm;
  po::store(po::parse_config_file(file, desc), vm);
  po::notify(vm);
  EXPECT_EQ(config.timeout, 2500ms);
  EXPECT_EQ(config.retry_delay, 10ms);
}

/**
 * @given durations that are negative, not finite or overflow milliseconds
 * @when parsed
 * @then invalid option value error
 */
TEST(FileLockConfigTest, UnrepresentableRejected) {
  for (auto arg : {"--lock-timeout=-1",
                   "--lock-timeout=inf",
                   "--lock-timeout=nan",
                   "--lock-timeout=1e30",
                   "--lock-retry-delay=-inf",
                   "--lock-retry-jitter=1e300"}) {
    EXPECT_THROW(parse({arg}), po::invalid_option_value) << arg;
  }
}

/**
 * @given very long but representable timeout
 * @when parsed
 * @then it is kept exactly
 */
TEST(FileLockConfigTest, LongTimeoutAccepted) {
  const auto config{parse({"--lock-timeout=1e9"})};
  EXPECT_EQ(config.timeout, std::chrono::seconds{1000000000});
}
