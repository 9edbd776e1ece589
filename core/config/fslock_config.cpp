/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/fslock_config.hpp"

#include <cmath>

namespace fl::config {
  using fslock::FileLockConfig;
  using fslock::milliseconds;

  namespace {
    /** Converts seconds option value, rejects values not representable as
     * non-negative milliseconds */
    milliseconds fromSeconds(const std::string &option, double seconds) {
      using DoubleMs = std::chrono::duration<double, std::milli>;
      const DoubleMs value{seconds * 1000};
      if (!std::isfinite(seconds) || seconds < 0
          || value >= DoubleMs{milliseconds::max()}) {
        boost::throw_exception(
            boost::program_options::invalid_option_value{option});
      }
      return std::chrono::round<milliseconds>(value);
    }
  }  // namespace

  options_description configFileLock(FileLockConfig &config) {
    namespace po = boost::program_options;
    const FileLockConfig defaults;
    const auto seconds{[](milliseconds value) {
      return std::chrono::duration<double>{value}.count();
    }};

    options_description optionsDescription("Lock options");
    auto option{optionsDescription.add_options()};
    option("lock-timeout",
           po::value<double>()
               ->default_value(seconds(defaults.timeout))
               ->notifier([&config](double value) {
                 config.timeout = fromSeconds("lock-timeout", value);
               }),
           "max time to wait for lock (seconds)");
    option("lock-retry-delay",
           po::value<double>()
               ->default_value(seconds(defaults.retry_delay))
               ->notifier([&config](double value) {
                 config.retry_delay = fromSeconds("lock-retry-delay", value);
               }),
           "delay between lock attempts (seconds)");
    option("lock-retry-jitter",
           po::value<double>()
               ->default_value(seconds(defaults.retry_jitter))
               ->notifier([&config](double value) {
                 config.retry_jitter = fromSeconds("lock-retry-jitter", value);
               }),
           "max random delay added to each retry (seconds)");
    option("lock-strict-permissions",
           po::bool_switch()->notifier([&config](bool strict) {
             config.permission_denied_is_contention = !strict;
           }),
           "fail immediately on permission denied instead of retrying");
    return optionsDescription;
  }
}  // namespace fl::config
