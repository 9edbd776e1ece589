/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/throw_exception.hpp>
#include <libp2p/outcome/outcome.hpp>
#include <string>
#include <system_error>

namespace fl::outcome {
  using libp2p::outcome::result;
  using libp2p::outcome::success;

  /**
   * @brief throws outcome::result error as boost exception with context
   * @param ec error code
   * @param what context prepended to error message
   */
  [[noreturn]] inline void raise(const std::error_code &ec,
                                 const std::string &what) {
    boost::throw_exception(std::system_error(ec, what));
  }
}  // namespace fl::outcome
