/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_RESULT_TRY_HPP
#define CONSIGN_RESULT_TRY_HPP

#include "common/result.hpp"

#define CONSIGN_EXPECTED_ERROR_CHECK(...)                        \
  if (auto _tmp_gen_var = (__VA_ARGS__);                         \
      consign::expected::hasError(_tmp_gen_var))                 \
  return consign::expected::makeError(                           \
      std::move(_tmp_gen_var).assumeError())

#define CONSIGN_EXPECTED_TRY_GET_VALUE(name, ...)                       \
  auto name##_result_ = (__VA_ARGS__);                                  \
  if (consign::expected::hasError(name##_result_)) {                    \
    return consign::expected::makeError(                                \
        std::move(name##_result_).assumeError());                       \
  }                                                                     \
  auto name = std::move(name##_result_).assumeValue()

#endif  // CONSIGN_RESULT_TRY_HPP
