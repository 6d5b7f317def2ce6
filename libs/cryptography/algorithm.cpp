/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/algorithm.hpp"

#include <algorithm>
#include <array>

namespace {
  using consign::crypto::Algorithm;

  struct AlgorithmInfo {
    Algorithm algorithm;
    const char *name;
    int64_t cose_id;
  };

  constexpr std::array<AlgorithmInfo, 7> kAlgorithms{{
      {Algorithm::kEs256, "ES256", -7},
      {Algorithm::kEs384, "ES384", -35},
      {Algorithm::kEs512, "ES512", -36},
      {Algorithm::kPs256, "PS256", -37},
      {Algorithm::kPs384, "PS384", -38},
      {Algorithm::kPs512, "PS512", -39},
      {Algorithm::kEdDsa, "EdDSA", -8},
  }};

  const AlgorithmInfo &info(Algorithm algorithm) {
    return *std::find_if(
        kAlgorithms.begin(), kAlgorithms.end(), [algorithm](const auto &i) {
          return i.algorithm == algorithm;
        });
  }
}  // namespace

namespace consign {
  namespace crypto {

    std::string algorithmName(Algorithm algorithm) {
      return info(algorithm).name;
    }

    int64_t coseAlgorithmId(Algorithm algorithm) {
      return info(algorithm).cose_id;
    }

    std::optional<Algorithm> algorithmFromName(const std::string &name) {
      for (const auto &i : kAlgorithms) {
        if (name == i.name) {
          return i.algorithm;
        }
      }
      return std::nullopt;
    }

    std::optional<Algorithm> algorithmFromCoseId(int64_t id) {
      for (const auto &i : kAlgorithms) {
        if (id == i.cose_id) {
          return i.algorithm;
        }
      }
      return std::nullopt;
    }

    std::vector<std::string> supportedAlgorithmNames() {
      std::vector<std::string> names;
      for (const auto &i : kAlgorithms) {
        names.emplace_back(i.name);
      }
      return names;
    }

    Algorithm inferAlgorithm(KeyType type) {
      switch (type) {
        case KeyType::kEcP256:
          return Algorithm::kEs256;
        case KeyType::kEcP384:
          return Algorithm::kEs384;
        case KeyType::kEcP521:
          return Algorithm::kEs512;
        case KeyType::kRsa:
          return Algorithm::kPs256;
        case KeyType::kEd25519:
          return Algorithm::kEdDsa;
      }
      return Algorithm::kEs256;
    }

    bool isCompatible(Algorithm algorithm, KeyType type) {
      switch (algorithm) {
        case Algorithm::kEs256:
          return type == KeyType::kEcP256;
        case Algorithm::kEs384:
          return type == KeyType::kEcP384;
        case Algorithm::kEs512:
          return type == KeyType::kEcP521;
        case Algorithm::kPs256:
        case Algorithm::kPs384:
        case Algorithm::kPs512:
          return type == KeyType::kRsa;
        case Algorithm::kEdDsa:
          return type == KeyType::kEd25519;
      }
      return false;
    }

  }  // namespace crypto
}  // namespace consign
