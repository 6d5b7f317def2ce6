/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_UTF8_HPP
#define CONSIGN_UTF8_HPP

#include <cstddef>
#include <cstdint>

#include "common/byte_range.hpp"

namespace consign {

  /// @return true if every byte is 7-bit ASCII
  inline bool isAscii(ByteRange data) {
    for (auto b : data) {
      if (static_cast<uint8_t>(b) > 0x7F) {
        return false;
      }
    }
    return true;
  }

  /**
   * Check that the data is well-formed UTF-8: no overlong forms, no
   * surrogates, no code points above U+10FFFF.
   */
  inline bool isValidUtf8(ByteRange data) {
    const uint8_t *p = rangeData(data);
    const size_t size = data.size();
    size_t i = 0;
    while (i < size) {
      const uint8_t c = p[i];
      size_t continuation = 0;
      uint32_t code_point = 0;
      uint32_t min_code_point = 0;
      if (c < 0x80) {
        ++i;
        continue;
      } else if ((c & 0xE0) == 0xC0) {
        continuation = 1;
        code_point = c & 0x1F;
        min_code_point = 0x80;
      } else if ((c & 0xF0) == 0xE0) {
        continuation = 2;
        code_point = c & 0x0F;
        min_code_point = 0x800;
      } else if ((c & 0xF8) == 0xF0) {
        continuation = 3;
        code_point = c & 0x07;
        min_code_point = 0x10000;
      } else {
        return false;
      }
      if (i + continuation >= size) {
        return false;
      }
      for (size_t k = 1; k <= continuation; ++k) {
        const uint8_t cc = p[i + k];
        if ((cc & 0xC0) != 0x80) {
          return false;
        }
        code_point = (code_point << 6) | (cc & 0x3F);
      }
      if (code_point < min_code_point or code_point > 0x10FFFF
          or (code_point >= 0xD800 and code_point <= 0xDFFF)) {
        return false;
      }
      i += continuation + 1;
    }
    return true;
  }

}  // namespace consign

#endif  // CONSIGN_UTF8_HPP
