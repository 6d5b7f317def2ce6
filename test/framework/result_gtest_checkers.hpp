/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_RESULT_GTEST_CHECKERS_HPP
#define CONSIGN_RESULT_GTEST_CHECKERS_HPP

#include "common/result.hpp"

#include <string>
#include <type_traits>

#include <fmt/core.h>
#include <gtest/gtest.h>
#include "common/byte_range.hpp"

namespace framework {
  namespace expected {
    namespace detail {
      template <typename T, typename = void>
      struct HasToString : std::false_type {};

      template <typename T>
      struct HasToString<
          T,
          std::void_t<decltype(std::declval<const T &>().toString())>>
          : std::true_type {};

      /// Text shown when a result holds the unexpected alternative
      template <typename T>
      std::string describe(const T &object) {
        if constexpr (std::is_convertible<T, std::string>::value) {
          return object;
        } else if constexpr (HasToString<T>::value) {
          return object.toString();
        } else if constexpr (std::is_same<T, consign::Bytes>::value) {
          std::string hex;
          for (auto byte : object) {
            hex += fmt::format("{:02x}", byte);
          }
          return fmt::format("{} bytes: {}", object.size(), hex);
        } else {
          return "a value without description";
        }
      }

      template <typename V, typename E>
      std::string describeValue(const consign::expected::Result<V, E> &r) {
        return describe(r.assumeValue());
      }

      template <typename E>
      std::string describeValue(const consign::expected::Result<void, E> &) {
        return "void value";
      }

      template <typename V, typename E>
      void assertResultValue(const consign::expected::Result<V, E> &r) {
        ASSERT_TRUE(consign::expected::hasValue(r))
            << "Value expected, but got error: " << describe(r.assumeError());
      }

      template <typename V, typename E>
      void assertResultError(const consign::expected::Result<V, E> &r) {
        ASSERT_TRUE(consign::expected::hasError(r))
            << "Error expected, but got value: " << describeValue(r);
      }
    }  // namespace detail
  }  // namespace expected
}  // namespace framework

#define CONSIGN_ASSERT_RESULT_VALUE(result) \
  ASSERT_NO_FATAL_FAILURE(                  \
      ::framework::expected::detail::assertResultValue(result))

#define CONSIGN_ASSERT_RESULT_ERROR(result) \
  ASSERT_NO_FATAL_FAILURE(                  \
      ::framework::expected::detail::assertResultError(result))

/// Assert that the result holds a SigningError with the given code
#define CONSIGN_ASSERT_SIGNING_ERROR(result, error_code)                \
  CONSIGN_ASSERT_RESULT_ERROR(result);                                  \
  ASSERT_EQ((result).assumeError().code, error_code)                    \
      << (result).assumeError().toString()

#endif  // CONSIGN_RESULT_GTEST_CHECKERS_HPP
