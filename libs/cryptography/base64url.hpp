/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_BASE64URL_HPP
#define CONSIGN_BASE64URL_HPP

#include <string>
#include <string_view>

#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"

namespace consign {
  namespace crypto {

    /// Base64url without padding (RFC 7515, appendix C)
    std::string base64UrlEncode(ByteRange data);

    /**
     * Decode base64url text. Trailing padding is tolerated, any character
     * outside the URL-safe alphabet is an error.
     */
    expected::Result<Bytes, std::string> base64UrlDecode(std::string_view text);

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_BASE64URL_HPP
