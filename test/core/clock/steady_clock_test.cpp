/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/steady_clock_impl.hpp"

#include <gtest/gtest.h>
#include <thread>

using fl::clock::SteadyClockImpl;
using namespace std::chrono_literals;

/**
 * @given steady clock
 * @when time is read before and after sleep
 * @then it advances at least by sleep duration
 */
TEST(SteadyClockTest, Monotonic) {
  SteadyClockImpl clock;
  const auto before{clock.nowMicro()};
  std::this_thread::sleep_for(10ms);
  const auto after{clock.nowMicro()};
  EXPECT_GE(after - before, 10ms);
}
