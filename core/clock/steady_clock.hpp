/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace fl::clock {
  using std::chrono::microseconds;

  /**
   * Provides monotonic time, unaffected by wall clock adjustments
   */
  class SteadyClock {
   public:
    virtual microseconds nowMicro() const = 0;
    virtual ~SteadyClock() = default;
  };
}  // namespace fl::clock
