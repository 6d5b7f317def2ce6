/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_COSE_SIGN_MESSAGE_HPP
#define CONSIGN_COSE_SIGN_MESSAGE_HPP

#include <string>
#include <vector>

#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"
#include "envelope/cose_headers.hpp"

namespace consign {
  namespace cose {

    /// COSE_Signature = [protected: bstr, unprotected: map, signature: bstr]
    struct CoseSignature {
      /// contents of the protected header byte string
      Bytes protected_header;
      SignerHeaders headers;
      Bytes signature;
      /// the whole encoded item, as found in the message
      Bytes encoded;
    };

    /**
     * Decoded COSE_Sign message with an attached payload. Keeps the encoded
     * bytes needed to append a signature without touching anything else.
     */
    struct CoseSignMessage {
      /// contents of the body protected header byte string
      Bytes body_protected;
      BodyHeaders body_headers;
      Bytes payload;
      std::vector<CoseSignature> signatures;
      /// encoded bytes from the start up to the signatures array
      Bytes prefix;
    };

    /**
     * Build the Sig_structure covered by a COSE_Signature:
     * ["Signature", body_protected, sign_protected, h'', payload]
     */
    Bytes makeSigStructure(ByteRange body_protected,
                           ByteRange sign_protected,
                           ByteRange payload);

    /// Encode a COSE_Signature with an empty unprotected header.
    Bytes encodeCoseSignature(ByteRange sign_protected, ByteRange signature);

    /**
     * Encode a tagged COSE_Sign message with an empty unprotected header.
     * @param signatures - encoded COSE_Signature items
     */
    Bytes encodeCoseSign(ByteRange body_protected,
                         ByteRange payload,
                         const std::vector<Bytes> &signatures);

    /**
     * Decode a COSE_Sign message, tagged with 98 or untagged. Detached
     * payloads, trailing bytes and messages without signatures are
     * rejected.
     */
    expected::Result<CoseSignMessage, std::string> decodeCoseSign(
        ByteRange encoded);

    /**
     * Re-encode a decoded message with one more signature. All bytes before
     * the signatures array and all existing signatures are copied verbatim.
     * @param signature - encoded COSE_Signature item
     */
    Bytes appendSignature(const CoseSignMessage &message, ByteRange signature);

  }  // namespace cose
}  // namespace consign

#endif  // CONSIGN_COSE_SIGN_MESSAGE_HPP
