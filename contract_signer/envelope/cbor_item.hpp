/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_CBOR_ITEM_HPP
#define CONSIGN_CBOR_ITEM_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <cbor.h>
#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"

namespace consign {
  namespace cbor {

    /// Drops one reference of a libcbor item
    struct ItemDeleter {
      void operator()(cbor_item_t *item) const {
        cbor_decref(&item);
      }
    };

    using ItemPtr = std::unique_ptr<cbor_item_t, ItemDeleter>;

    /// Integer in the shortest head that holds it
    ItemPtr makeInt(int64_t value);
    ItemPtr makeText(std::string_view text);
    ItemPtr makeBytes(ByteRange bytes);
    ItemPtr makeArray(size_t size);
    ItemPtr makeMap(size_t size);

    /// Containers take their own reference, the caller keeps its pointer.
    void arrayPush(cbor_item_t *array, const ItemPtr &item);
    void mapAdd(cbor_item_t *map, const ItemPtr &key, const ItemPtr &value);

    Bytes serialize(const cbor_item_t *item);

    /// Append the head of a tag, or of a definite array
    void appendTagHead(Bytes &out, uint64_t tag);
    void appendArrayHead(Bytes &out, size_t size);

    /**
     * Decode exactly one data item. Truncated or malformed input, trailing
     * bytes and indefinite length items are rejected.
     */
    expected::Result<ItemPtr, std::string> decode(ByteRange encoded);

    /// Number of bytes taken by the first data item of the input
    expected::Result<size_t, std::string> itemLength(ByteRange encoded);

    /// Number of bytes taken by the head of the first data item
    expected::Result<size_t, std::string> headLength(ByteRange encoded);

    std::string typeName(const cbor_item_t *item);

    /// Value of an integer item that fits int64
    std::optional<int64_t> asInt(const cbor_item_t *item);

    /// Contents of a definite text string holding valid UTF-8
    std::optional<std::string> asText(const cbor_item_t *item);

    /// Contents of a definite byte string
    std::optional<Bytes> asBytes(const cbor_item_t *item);

    /// Value stored under an integer label, null if there is none
    const cbor_item_t *findInMap(const cbor_item_t *map, int64_t label);

  }  // namespace cbor
}  // namespace consign

#endif  // CONSIGN_CBOR_ITEM_HPP
