/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_COSE_HEADERS_HPP
#define CONSIGN_COSE_HEADERS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"
#include "envelope/registration_info.hpp"

namespace consign {
  namespace cose {

    /// Tag of a COSE_Sign message (RFC 9052, section 2)
    constexpr uint64_t kCoseSignTag = 98;

    /// Header labels
    constexpr int64_t kHeaderAlgorithm = 1;
    constexpr int64_t kHeaderContentType = 3;
    constexpr int64_t kHeaderKeyId = 4;
    constexpr int64_t kHeaderIssuer = 391;
    constexpr int64_t kHeaderFeed = 392;
    constexpr int64_t kHeaderRegistrationInfo = 393;

    /// Protected header of the message body, shared by all signatures
    struct BodyHeaders {
      std::optional<std::string> content_type;
      std::optional<std::string> feed;
      /// entries with distinct names, in encoding order
      RegistrationInfo registration_info;
    };

    /// Protected header of a single COSE_Signature
    struct SignerHeaders {
      /// COSE algorithm identifier, kept as is for unknown algorithms
      std::optional<int64_t> algorithm;
      std::optional<std::string> key_id;
      std::optional<std::string> issuer;
    };

    /**
     * Serialize body headers into the contents of the protected header
     * byte string. The registration info map is omitted when empty.
     */
    Bytes encodeBodyHeaders(const BodyHeaders &headers);

    /**
     * Parse the contents of the body protected header byte string. Unknown
     * labels are skipped.
     */
    expected::Result<BodyHeaders, std::string> decodeBodyHeaders(
        ByteRange encoded);

    Bytes encodeSignerHeaders(const SignerHeaders &headers);

    expected::Result<SignerHeaders, std::string> decodeSignerHeaders(
        ByteRange encoded);

  }  // namespace cose
}  // namespace consign

#endif  // CONSIGN_COSE_HEADERS_HPP
