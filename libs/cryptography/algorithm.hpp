/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_ALGORITHM_HPP
#define CONSIGN_ALGORITHM_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cryptography/key_type.hpp"

namespace consign {
  namespace crypto {

    /// COSE signature algorithms (IANA "COSE Algorithms" registry)
    enum class Algorithm {
      kEs256,
      kEs384,
      kEs512,
      kPs256,
      kPs384,
      kPs512,
      kEdDsa,
    };

    /// @return registered name, e.g. "ES256"
    std::string algorithmName(Algorithm algorithm);

    /// @return registered integer identifier, e.g. -7 for ES256
    int64_t coseAlgorithmId(Algorithm algorithm);

    /// Case-sensitive lookup by registered name.
    std::optional<Algorithm> algorithmFromName(const std::string &name);

    std::optional<Algorithm> algorithmFromCoseId(int64_t id);

    /// Names of all supported algorithms, in declaration order
    std::vector<std::string> supportedAlgorithmNames();

    /// Default algorithm for a key type
    Algorithm inferAlgorithm(KeyType type);

    /// @return true if keys of the given type can produce the algorithm
    bool isCompatible(Algorithm algorithm, KeyType type);

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_ALGORITHM_HPP
