/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_RESULT_HPP
#define CONSIGN_RESULT_HPP

#include "common/result_fwd.hpp"

#include <ciso646>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/variant.hpp>

#include "common/visitor.hpp"

/*
 * Result holds either a value or an error. Both are template parameters.
 * Contents are accessed with match(), which takes one function for the value
 * case and one for the error case, or with the bind operator |.
 */

namespace consign {
  namespace expected {

    struct ValueBase {};

    template <typename T>
    struct Value : ValueBase {
      using type = T;
      template <
          typename... Args,
          typename = std::enable_if_t<std::is_constructible<T, Args...>::value>>
      Value(Args &&... args) : value(std::forward<Args>(args)...) {}
      T value;
      template <typename V>
      operator Value<V>() && {
        return {std::move(value)};
      }
    };

    template <>
    struct Value<void> {};

    struct ErrorBase {};

    template <typename E>
    struct Error : ErrorBase {
      using type = E;
      template <
          typename... Args,
          typename = std::enable_if_t<std::is_constructible<E, Args...>::value>>
      Error(Args &&... args) : error(std::forward<Args>(args)...) {}
      E error;
      template <typename V>
      operator Error<V>() && {
        return {std::move(error)};
      }
    };

    template <>
    struct Error<void> {};

    class ResultException : public std::runtime_error {
      using std::runtime_error::runtime_error;
    };

    struct ResultBase {};

    /**
     * Value-or-error type on top of boost::variant.
     * @tparam V type of value
     * @tparam E error type
     */
    template <typename V, typename E>
    class Result : ResultBase, public boost::variant<Value<V>, Error<E>> {
      using variant_type = boost::variant<Value<V>, Error<E>>;
      using variant_type::variant_type;  // inherit constructors

     public:
      using ValueType = Value<V>;
      using ErrorType = Error<E>;

      using ValueInnerType = V;
      using ErrorInnerType = E;

      Result() = default;

      /**
       * Call value_func with the value or error_func with the error. Both
       * functions must return the same type. Example:
       * @code
       * result.match([](Value<int> v) { std::cout << v.value; },
       *              [](Error<std::string> e) { std::cout << e.error; });
       * @nocode
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func, ErrorMatch &&error_func) & {
        return visit_in_place(*this,
                              [f = std::forward<ValueMatch>(value_func)](
                                  ValueType &v) { return f(v); },
                              [f = std::forward<ErrorMatch>(error_func)](
                                  ErrorType &e) { return f(e); });
      }

      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func,
                           ErrorMatch &&error_func) && {
        return visit_in_place(*this,
                              [f = std::forward<ValueMatch>(value_func)](
                                  ValueType &v) { return f(std::move(v)); },
                              [f = std::forward<ErrorMatch>(error_func)](
                                  ErrorType &e) { return f(std::move(e)); });
      }

      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func,
                           ErrorMatch &&error_func) const & {
        return visit_in_place(*this,
                              [f = std::forward<ValueMatch>(value_func)](
                                  const ValueType &v) { return f(v); },
                              [f = std::forward<ErrorMatch>(error_func)](
                                  const ErrorType &e) { return f(e); });
      }

      using AssumeValueHelper =
          std::conditional_t<std::is_void<ValueInnerType>::value,
                             void *,
                             ValueInnerType>;

      /// @return value if present, otherwise throw ResultException
      template <typename ReturnType = const AssumeValueHelper &>
      std::enable_if_t<not std::is_void<ValueInnerType>::value, ReturnType>
      assumeValue() const & {
        const auto *val = boost::get<ValueType>(this);
        if (val != nullptr) {
          return val->value;
        }
        throw ResultException("Value expected, but got an Error.");
      }

      template <typename ReturnType = AssumeValueHelper &>
      std::enable_if_t<not std::is_void<ValueInnerType>::value, ReturnType>
      assumeValue() & {
        auto *val = boost::get<ValueType>(this);
        if (val != nullptr) {
          return val->value;
        }
        throw ResultException("Value expected, but got an Error.");
      }

      template <typename ReturnType = AssumeValueHelper &&>
      std::enable_if_t<not std::is_void<ValueInnerType>::value, ReturnType>
      assumeValue() && {
        auto *val = boost::get<ValueType>(this);
        if (val != nullptr) {
          return std::move(val->value);
        }
        throw ResultException("Value expected, but got an Error.");
      }

      using AssumeErrorHelper =
          std::conditional_t<std::is_void<ErrorInnerType>::value,
                             void *,
                             ErrorInnerType>;

      /// @return error if present, otherwise throw ResultException
      template <typename ReturnType = const AssumeErrorHelper &>
      std::enable_if_t<not std::is_void<ErrorInnerType>::value, ReturnType>
      assumeError() const & {
        const auto *err = boost::get<ErrorType>(this);
        if (err != nullptr) {
          return err->error;
        }
        throw ResultException("Error expected, but got a Value.");
      }

      template <typename ReturnType = AssumeErrorHelper &>
      std::enable_if_t<not std::is_void<ErrorInnerType>::value, ReturnType>
      assumeError() & {
        auto *err = boost::get<ErrorType>(this);
        if (err != nullptr) {
          return err->error;
        }
        throw ResultException("Error expected, but got a Value.");
      }

      template <typename ReturnType = AssumeErrorHelper &&>
      std::enable_if_t<not std::is_void<ErrorInnerType>::value, ReturnType>
      assumeError() && {
        auto *err = boost::get<ErrorType>(this);
        if (err != nullptr) {
          return std::move(err->error);
        }
        throw ResultException("Error expected, but got a Value.");
      }
    };

    template <typename ResultType>
    using ValueOf = typename std::decay_t<ResultType>::ValueType;
    template <typename ResultType>
    using ErrorOf = typename std::decay_t<ResultType>::ErrorType;

    template <typename ResultType>
    using InnerValueOf = typename std::decay_t<ResultType>::ValueInnerType;
    template <typename ResultType>
    using InnerErrorOf = typename std::decay_t<ResultType>::ErrorInnerType;

    inline Value<void> makeValue() {
      return Value<void>{};
    }

    template <typename T>
    Value<std::decay_t<T>> makeValue(T &&value) {
      return Value<std::decay_t<T>>{std::forward<T>(value)};
    }

    inline Error<void> makeError() {
      return Error<void>{};
    }

    template <typename E>
    Error<std::decay_t<E>> makeError(E &&error) {
      return Error<std::decay_t<E>>{std::forward<E>(error)};
    }

    /**
     * Get a new result with the moved value or mapped error
     * @param res base Result
     * @param map callback for error mapping
     * @return result with changed error
     */
    template <typename Err1, typename Err2, typename V, typename Fn>
    Result<V, Err1> map_error(Result<V, Err2> res, Fn &&map) {
      return std::move(res).match(
          [](auto &&val) -> Result<V, Err1> { return std::move(val); },
          [&map](auto &&err) -> Result<V, Err1> {
            return Error<Err1>{map(std::move(err.error))};
          });
    }

    template <typename T>
    constexpr bool isResult =
        std::is_base_of<ResultBase, std::decay_t<T>>::value;
    template <typename T>
    constexpr bool isValue = std::is_base_of<ValueBase, std::decay_t<T>>::value;

    /**
     * Result type of the bind operator for a transformation function
     * returning Transformed, given the former Result error type.
     */
    template <typename Transformed, typename ErrorType, typename = void>
    struct BindReturnType;

    /// Transformation function returns an unwrapped value.
    template <typename Transformed, typename ErrorType>
    struct BindReturnType<
        Transformed,
        ErrorType,
        std::enable_if_t<not isResult<Transformed> and not isValue<Transformed>
                         and not std::is_void<Transformed>::value>> {
      using ReturnType = Result<Transformed, ErrorType>;
      static ReturnType makeValue(Transformed &&result) {
        return consign::expected::makeValue(std::move(result));
      }
    };

    /// Transformation function returns Result.
    template <typename Transformed, typename ErrorType>
    struct BindReturnType<Transformed,
                          ErrorType,
                          std::enable_if_t<isResult<Transformed>>> {
      using ReturnType = Transformed;
      static ReturnType makeValue(Transformed &&result) {
        return std::move(result);
      }
    };

    /**
     * Bind operator chains functions returning Result. An error is passed
     * through untouched, a value is handed to f.
     */
    template <typename V,
              typename E,
              typename Transform,
              typename TypeHelper = BindReturnType<
                  decltype(std::declval<Transform>()(std::declval<V>())),
                  E>,
              typename ReturnType = typename TypeHelper::ReturnType>
    constexpr auto operator|(Result<V, E> &&r, Transform &&f) -> ReturnType {
      return std::move(r).match(
          [&f](auto &&v) {
            return TypeHelper::makeValue(f(std::move(v.value)));
          },
          [](auto &&e) { return ReturnType(makeError(std::move(e.error))); });
    }

    template <typename V,
              typename E,
              typename Transform,
              typename TypeHelper = BindReturnType<
                  decltype(std::declval<Transform>()(std::declval<const V &>())),
                  E>,
              typename ReturnType = typename TypeHelper::ReturnType>
    constexpr auto operator|(const Result<V, E> &r, Transform &&f)
        -> ReturnType {
      return r.match(
          [&f](const auto &v) { return TypeHelper::makeValue(f(v.value)); },
          [](const auto &e) { return ReturnType(makeError(e.error)); });
    }

    /// Bind for Result<void, E>: f takes no arguments.
    template <typename E,
              typename Procedure,
              typename TypeHelper =
                  BindReturnType<decltype(std::declval<Procedure>()()), E>,
              typename ReturnType = typename TypeHelper::ReturnType>
    constexpr auto operator|(const Result<void, E> &r, Procedure &&f)
        -> ReturnType {
      return r.match(
          [&f](const auto &) { return TypeHelper::makeValue(f()); },
          [](const auto &e) { return ReturnType(makeError(e.error)); });
    }

    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    bool hasValue(const ResultType &result) {
      return boost::get<ValueOf<ResultType>>(&result) != nullptr;
    }

    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    bool hasError(const ResultType &result) {
      return boost::get<ErrorOf<ResultType>>(&result) != nullptr;
    }

    /// @return optional with value if present, otherwise nullopt
    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    std::optional<InnerValueOf<ResultType>> resultToOptionalValue(
        ResultType &&res) {
      if (hasValue(res)) {
        return boost::get<ValueOf<ResultType>>(std::forward<ResultType>(res))
            .value;
      }
      return std::nullopt;
    }

    /// @return optional with error if present, otherwise nullopt
    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    std::optional<InnerErrorOf<ResultType>> resultToOptionalError(
        ResultType &&res) {
      if (hasError(res)) {
        return boost::get<ErrorOf<ResultType>>(std::forward<ResultType>(res))
            .error;
      }
      return std::nullopt;
    }

  }  // namespace expected
}  // namespace consign

#endif  // CONSIGN_RESULT_HPP
