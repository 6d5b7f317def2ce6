/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/base64url.hpp"

#include <fmt/core.h>
#include <openssl/evp.h>
#include "common/result.hpp"

namespace consign {
  namespace crypto {

    std::string base64UrlEncode(ByteRange data) {
      std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
      const int length = EVP_EncodeBlock(
          reinterpret_cast<unsigned char *>(encoded.data()),
          rangeData(data),
          static_cast<int>(data.size()));
      encoded.resize(static_cast<size_t>(length));
      while (not encoded.empty() and encoded.back() == '=') {
        encoded.pop_back();
      }
      for (auto &c : encoded) {
        if (c == '+') {
          c = '-';
        } else if (c == '/') {
          c = '_';
        }
      }
      return encoded;
    }

    expected::Result<Bytes, std::string> base64UrlDecode(
        std::string_view text) {
      while (not text.empty() and text.back() == '=') {
        text.remove_suffix(1);
      }
      if (text.size() % 4 == 1) {
        return expected::makeError(
            fmt::format("'{}' has an invalid base64url length", text));
      }
      std::string standard;
      standard.reserve(text.size() + 3);
      for (char c : text) {
        if ((c >= 'A' and c <= 'Z') or (c >= 'a' and c <= 'z')
            or (c >= '0' and c <= '9')) {
          standard.push_back(c);
        } else if (c == '-') {
          standard.push_back('+');
        } else if (c == '_') {
          standard.push_back('/');
        } else {
          return expected::makeError(
              fmt::format("'{}' is not valid base64url", text));
        }
      }
      const size_t padding = (4 - standard.size() % 4) % 4;
      standard.append(padding, '=');

      Bytes decoded(standard.size() / 4 * 3);
      const int length = EVP_DecodeBlock(
          decoded.data(),
          reinterpret_cast<const unsigned char *>(standard.data()),
          static_cast<int>(standard.size()));
      if (length < 0) {
        return expected::makeError(
            fmt::format("'{}' is not valid base64url", text));
      }
      // EVP_DecodeBlock counts the padding characters as zero bytes
      decoded.resize(static_cast<size_t>(length) - padding);
      return expected::makeValue(std::move(decoded));
    }

  }  // namespace crypto
}  // namespace consign
