/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signing/signer.hpp"

#include <fmt/core.h>

namespace consign {

  std::string Signer::toString() const {
    return fmt::format("Signer: [{}, issuer: {}, kid: {}, alg: {}]",
                       key.toString(),
                       issuer.value_or("<none>"),
                       key_id.value_or("<none>"),
                       crypto::algorithmName(effectiveAlgorithm()));
  }

}  // namespace consign
