/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/steady_clock_impl.hpp"

namespace fl::clock {
  microseconds SteadyClockImpl::nowMicro() const {
    return std::chrono::duration_cast<microseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
  }
}  // namespace fl::clock
