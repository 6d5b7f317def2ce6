/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_VISITOR_HPP
#define CONSIGN_VISITOR_HPP

#include <utility>

#include <boost/variant/apply_visitor.hpp>

namespace consign {

  /// A visitor assembled from a set of lambdas, one per alternative.
  template <typename... Lambdas>
  struct LambdaVisitor : Lambdas... {
    using Lambdas::operator()...;
  };

  template <typename... Lambdas>
  LambdaVisitor(Lambdas...) -> LambdaVisitor<Lambdas...>;

  template <typename... Lambdas>
  constexpr auto makeVisitor(Lambdas &&... lambdas) {
    return LambdaVisitor<std::decay_t<Lambdas>...>{
        std::forward<Lambdas>(lambdas)...};
  }

  /**
   * Apply a set of lambdas to a boost::variant in place. Example:
   * @code
   * visit_in_place(value,
   *                [](int64_t i) { ... },
   *                [](const std::string &s) { ... });
   * @nocode
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&... visitors) {
    return boost::apply_visitor(
        makeVisitor(std::forward<TVisitors>(visitors)...),
        std::forward<TVariant>(variant));
  }

}  // namespace consign

#endif  // CONSIGN_VISITOR_HPP
