/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "envelope/cbor_item.hpp"

#include <cstdlib>
#include <limits>
#include <new>

#include <fmt/core.h>
#include "common/result.hpp"
#include "common/utf8.hpp"

namespace {
  using consign::cbor::ItemPtr;

  /// Longest head: initial byte and an 8 byte argument
  constexpr size_t kMaxHeadLength = 9;

  ItemPtr checked(cbor_item_t *item) {
    if (item == nullptr) {
      throw std::bad_alloc();
    }
    return ItemPtr(item);
  }

  ItemPtr makeUnsigned(uint64_t value, bool negative) {
    if (value <= std::numeric_limits<uint8_t>::max()) {
      auto v = static_cast<uint8_t>(value);
      return checked(negative ? cbor_build_negint8(v) : cbor_build_uint8(v));
    }
    if (value <= std::numeric_limits<uint16_t>::max()) {
      auto v = static_cast<uint16_t>(value);
      return checked(negative ? cbor_build_negint16(v) : cbor_build_uint16(v));
    }
    if (value <= std::numeric_limits<uint32_t>::max()) {
      auto v = static_cast<uint32_t>(value);
      return checked(negative ? cbor_build_negint32(v) : cbor_build_uint32(v));
    }
    return checked(negative ? cbor_build_negint64(value)
                            : cbor_build_uint64(value));
  }

  template <typename Encode, typename Argument>
  void appendHead(consign::Bytes &out, Encode encode, Argument argument) {
    unsigned char head[kMaxHeadLength];
    const auto length = encode(argument, head, sizeof(head));
    out.insert(out.end(), head, head + length);
  }

  bool allDefinite(const cbor_item_t *item) {
    switch (cbor_typeof(item)) {
      case CBOR_TYPE_BYTESTRING:
        return cbor_bytestring_is_definite(item);
      case CBOR_TYPE_STRING:
        return cbor_string_is_definite(item);
      case CBOR_TYPE_ARRAY: {
        if (not cbor_array_is_definite(item)) {
          return false;
        }
        auto **elements = cbor_array_handle(item);
        for (size_t i = 0; i < cbor_array_size(item); ++i) {
          if (not allDefinite(elements[i])) {
            return false;
          }
        }
        return true;
      }
      case CBOR_TYPE_MAP: {
        if (not cbor_map_is_definite(item)) {
          return false;
        }
        auto *pairs = cbor_map_handle(item);
        for (size_t i = 0; i < cbor_map_size(item); ++i) {
          if (not allDefinite(pairs[i].key) or not allDefinite(pairs[i].value)) {
            return false;
          }
        }
        return true;
      }
      case CBOR_TYPE_TAG: {
        ItemPtr tagged(cbor_tag_item(item));
        return allDefinite(tagged.get());
      }
      default:
        return true;
    }
  }

  std::string loadError(const cbor_load_result &result) {
    std::string reason;
    switch (result.error.code) {
      case CBOR_ERR_NOTENOUGHDATA:
        reason = "truncated data item";
        break;
      case CBOR_ERR_NODATA:
        reason = "no data";
        break;
      case CBOR_ERR_MALFORMATED:
        reason = "malformed data item";
        break;
      case CBOR_ERR_MEMERROR:
        reason = "out of memory";
        break;
      case CBOR_ERR_SYNTAXERROR:
        reason = "syntax error";
        break;
      default:
        reason = "decoding failed";
        break;
    }
    return fmt::format("{} at byte {}", reason, result.error.position);
  }

  consign::expected::Result<ItemPtr, std::string> load(
      consign::ByteRange encoded, size_t &read) {
    cbor_load_result result;
    ItemPtr item(cbor_load(consign::rangeData(encoded), encoded.size(), &result));
    if (not item or result.error.code != CBOR_ERR_NONE) {
      return consign::expected::makeError(loadError(result));
    }
    read = result.read;
    return consign::expected::makeValue(std::move(item));
  }
}  // namespace

namespace consign {
  namespace cbor {

    ItemPtr makeInt(int64_t value) {
      if (value >= 0) {
        return makeUnsigned(static_cast<uint64_t>(value), false);
      }
      // -1 - n, computed without overflow for the minimum value
      return makeUnsigned(~static_cast<uint64_t>(value), true);
    }

    ItemPtr makeText(std::string_view text) {
      if (text.empty()) {
        return checked(cbor_new_definite_string());
      }
      return checked(cbor_build_stringn(text.data(), text.size()));
    }

    ItemPtr makeBytes(ByteRange bytes) {
      if (bytes.empty()) {
        return checked(cbor_new_definite_bytestring());
      }
      return checked(cbor_build_bytestring(rangeData(bytes), bytes.size()));
    }

    ItemPtr makeArray(size_t size) {
      return checked(cbor_new_definite_array(size));
    }

    ItemPtr makeMap(size_t size) {
      return checked(cbor_new_definite_map(size));
    }

    void arrayPush(cbor_item_t *array, const ItemPtr &item) {
      if (not cbor_array_push(array, item.get())) {
        throw std::bad_alloc();
      }
    }

    void mapAdd(cbor_item_t *map, const ItemPtr &key, const ItemPtr &value) {
      if (not cbor_map_add(map, cbor_pair{key.get(), value.get()})) {
        throw std::bad_alloc();
      }
    }

    Bytes serialize(const cbor_item_t *item) {
      unsigned char *buffer = nullptr;
      size_t buffer_size = 0;
      const auto length = cbor_serialize_alloc(item, &buffer, &buffer_size);
      if (length == 0) {
        std::free(buffer);
        throw std::bad_alloc();
      }
      Bytes encoded(buffer, buffer + length);
      std::free(buffer);
      return encoded;
    }

    void appendTagHead(Bytes &out, uint64_t tag) {
      appendHead(out, &cbor_encode_tag, tag);
    }

    void appendArrayHead(Bytes &out, size_t size) {
      appendHead(out, &cbor_encode_array_start, size);
    }

    expected::Result<ItemPtr, std::string> decode(ByteRange encoded) {
      size_t read = 0;
      auto item = load(encoded, read);
      if (expected::hasError(item)) {
        return item;
      }
      if (read != encoded.size()) {
        return expected::makeError(
            fmt::format("{} trailing bytes after the data item",
                        encoded.size() - read));
      }
      if (not allDefinite(item.assumeValue().get())) {
        return expected::makeError(
            std::string{"indefinite length items are not accepted"});
      }
      return item;
    }

    expected::Result<size_t, std::string> itemLength(ByteRange encoded) {
      size_t read = 0;
      return load(encoded, read) | [&read](const ItemPtr &) { return read; };
    }

    expected::Result<size_t, std::string> headLength(ByteRange encoded) {
      auto result = cbor_stream_decode(
          rangeData(encoded), encoded.size(), &cbor_empty_callbacks, nullptr);
      if (result.status != CBOR_DECODER_FINISHED) {
        return expected::makeError(std::string{"truncated data item"});
      }
      return expected::makeValue(result.read);
    }

    std::string typeName(const cbor_item_t *item) {
      switch (cbor_typeof(item)) {
        case CBOR_TYPE_UINT:
        case CBOR_TYPE_NEGINT:
          return "integer";
        case CBOR_TYPE_BYTESTRING:
          return "byte string";
        case CBOR_TYPE_STRING:
          return "text string";
        case CBOR_TYPE_ARRAY:
          return "array";
        case CBOR_TYPE_MAP:
          return "map";
        case CBOR_TYPE_TAG:
          return "tagged item";
        case CBOR_TYPE_FLOAT_CTRL:
          return cbor_float_ctrl_is_ctrl(item) ? "simple value" : "float";
      }
      return "unknown item";
    }

    std::optional<int64_t> asInt(const cbor_item_t *item) {
      if (not cbor_is_int(item)) {
        return std::nullopt;
      }
      const uint64_t argument = cbor_get_int(item);
      if (argument > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
      }
      const auto value = static_cast<int64_t>(argument);
      return cbor_isa_negint(item) ? -1 - value : value;
    }

    std::optional<std::string> asText(const cbor_item_t *item) {
      if (not cbor_isa_string(item) or not cbor_string_is_definite(item)) {
        return std::nullopt;
      }
      const auto *data = cbor_string_handle(item);
      const auto length = cbor_string_length(item);
      if (length != 0 and not isValidUtf8(makeByteRange(data, length))) {
        return std::nullopt;
      }
      return length == 0 ? std::string{}
                         : std::string(reinterpret_cast<const char *>(data),
                                       length);
    }

    std::optional<Bytes> asBytes(const cbor_item_t *item) {
      if (not cbor_isa_bytestring(item)
          or not cbor_bytestring_is_definite(item)) {
        return std::nullopt;
      }
      const auto *data = cbor_bytestring_handle(item);
      const auto length = cbor_bytestring_length(item);
      return length == 0 ? Bytes{} : Bytes(data, data + length);
    }

    const cbor_item_t *findInMap(const cbor_item_t *map, int64_t label) {
      const auto *pairs = cbor_map_handle(map);
      for (size_t i = 0; i < cbor_map_size(map); ++i) {
        if (asInt(pairs[i].key) == label) {
          return pairs[i].value;
        }
      }
      return nullptr;
    }

  }  // namespace cbor
}  // namespace consign
