/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_ENVELOPE_VERIFIER_HPP
#define CONSIGN_ENVELOPE_VERIFIER_HPP

#include <optional>
#include <string>
#include <vector>

#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"
#include "envelope/cose_headers.hpp"
#include "error/signing_error.hpp"

namespace consign {

  namespace crypto {
    class PublicKey;
  }

  /// Readable contents of a signed envelope
  struct DecodedEnvelope {
    Bytes payload;
    cose::BodyHeaders body_headers;
    /// protected headers of each signature, in envelope order
    std::vector<cose::SignerHeaders> signers;
  };

  struct VerifiedEnvelope {
    DecodedEnvelope envelope;
    /// index of the first signature that verified
    size_t signature_index;
  };

  /**
   * Decode an envelope without checking signatures.
   * @return contents or kEnvelopeDecode error
   */
  expected::Result<DecodedEnvelope, SigningError> decodeEnvelope(
      ByteRange envelope);

  /**
   * Decode an envelope and check that at least one signature was made by
   * the key.
   * @return contents, kEnvelopeDecode error or kSignatureVerification error
   * when no signature verifies
   */
  expected::Result<VerifiedEnvelope, SigningError> verifyEnvelope(
      ByteRange envelope, const crypto::PublicKey &public_key);

}  // namespace consign

#endif  // CONSIGN_ENVELOPE_VERIFIER_HPP
