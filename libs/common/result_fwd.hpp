/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_RESULT_FWD_HPP
#define CONSIGN_RESULT_FWD_HPP

#include <string>

namespace consign {
  namespace expected {

    /// Value or error of a fallible operation. Library code reports errors as
    /// plain strings; the signing components use SigningError instead.
    template <typename V, typename E = std::string>
    class Result;

  }  // namespace expected
}  // namespace consign

#endif  // CONSIGN_RESULT_FWD_HPP
