/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_ECDSA_SIGNATURE_HPP
#define CONSIGN_ECDSA_SIGNATURE_HPP

#include <string>

#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"

namespace consign {
  namespace crypto {

    /**
     * Convert a DER encoded ECDSA-Sig-Value into the fixed width r || s
     * form used by COSE.
     * @param der - signature as produced by OpenSSL
     * @param component_size - size of r and s in bytes (32, 48 or 66)
     */
    expected::Result<Bytes, std::string> ecdsaDerToRaw(ByteRange der,
                                                       size_t component_size);

    /// Inverse of ecdsaDerToRaw.
    expected::Result<Bytes, std::string> ecdsaRawToDer(ByteRange raw,
                                                       size_t component_size);

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_ECDSA_SIGNATURE_HPP
