/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/steady_clock.hpp"

namespace fl::clock {
  class SteadyClockImpl : public SteadyClock {
   public:
    microseconds nowMicro() const override;
  };
}  // namespace fl::clock
