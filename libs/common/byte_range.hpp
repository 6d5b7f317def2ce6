/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_BYTE_RANGE_HPP
#define CONSIGN_BYTE_RANGE_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace consign {

  using Bytes = std::vector<uint8_t>;

  using ByteRange = std::basic_string_view<std::byte>;

  template <typename Source>
  inline ByteRange makeByteRange(Source const *data, size_t length) {
    static_assert(sizeof(Source) == sizeof(std::byte), "type mismatch");
    return ByteRange{reinterpret_cast<std::byte const *>(data), length};
  }

  template <typename Source>
  inline ByteRange makeByteRange(const Source &str) {
    return makeByteRange(str.data(), str.size());
  }

  inline const uint8_t *rangeData(ByteRange range) {
    return reinterpret_cast<const uint8_t *>(range.data());
  }

  inline Bytes toBytes(ByteRange range) {
    return Bytes{rangeData(range), rangeData(range) + range.size()};
  }

}  // namespace consign

#endif  // CONSIGN_BYTE_RANGE_HPP
