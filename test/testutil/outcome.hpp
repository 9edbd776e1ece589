/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

#define EXPECT_OUTCOME_TRUE_1(expr)                \
  {                                                \
    auto &&_r = expr;                              \
    EXPECT_TRUE(_r) << "Line " << __LINE__ << ": " \
                    << _r.error().message();       \
  }

#define EXPECT_OUTCOME_ERROR(error, expr)    \
  {                                          \
    auto &&_r = expr;                        \
    ASSERT_FALSE(_r) << "Line " << __LINE__; \
    EXPECT_EQ(_r.error(), error);            \
  }
