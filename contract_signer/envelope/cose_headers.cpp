/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "envelope/cose_headers.hpp"

#include <fmt/core.h>
#include "common/result.hpp"
#include "common/result_try.hpp"
#include "common/visitor.hpp"
#include "envelope/cbor_item.hpp"

namespace {
  using namespace consign;

  /// Empty protected headers are encoded as a zero length byte string
  expected::Result<cbor::ItemPtr, std::string> decodeHeaderMap(
      ByteRange encoded) {
    if (encoded.empty()) {
      return expected::makeValue(cbor::makeMap(0));
    }
    CONSIGN_EXPECTED_TRY_GET_VALUE(item, cbor::decode(encoded));
    if (not cbor_isa_map(item.get())) {
      return expected::makeError(
          fmt::format("protected header is a {}, expected a map",
                      cbor::typeName(item.get())));
    }
    return expected::makeValue(std::move(item));
  }

  expected::Result<std::string, std::string> textHeader(
      const cbor_item_t *item, const char *name) {
    if (auto text = cbor::asText(item)) {
      return expected::makeValue(std::move(*text));
    }
    return expected::makeError(
        fmt::format("{} header is a {}, expected a text string",
                    name,
                    cbor::typeName(item)));
  }

  cbor::ItemPtr toCbor(const RegistrationInfoValue &value) {
    return visit_in_place(
        value,
        [](const std::string &text) { return cbor::makeText(text); },
        [](const Bytes &bytes) {
          return cbor::makeBytes(makeByteRange(bytes));
        },
        [](int64_t number) { return cbor::makeInt(number); });
  }

  expected::Result<RegistrationInfo, std::string> decodeRegistrationInfo(
      const cbor_item_t *item) {
    if (not cbor_isa_map(item)) {
      return expected::makeError(
          fmt::format("registration info header is a {}, expected a map",
                      cbor::typeName(item)));
    }
    RegistrationInfo entries;
    const auto *pairs = cbor_map_handle(item);
    for (size_t i = 0; i < cbor_map_size(item); ++i) {
      auto name = cbor::asText(pairs[i].key);
      if (not name) {
        return expected::makeError(
            fmt::format("registration info key is a {}, expected a text string",
                        cbor::typeName(pairs[i].key)));
      }
      const auto *value = pairs[i].value;
      if (auto text = cbor::asText(value)) {
        entries.push_back({RegistrationInfoType::kText, *name, *text});
      } else if (auto bytes = cbor::asBytes(value)) {
        entries.push_back({RegistrationInfoType::kBytes, *name, *bytes});
      } else if (auto number = cbor::asInt(value)) {
        entries.push_back({RegistrationInfoType::kInt, *name, *number});
      } else {
        return expected::makeError(fmt::format(
            "registration info '{}' is a {}", *name, cbor::typeName(value)));
      }
    }
    return expected::makeValue(std::move(entries));
  }
}  // namespace

namespace consign {
  namespace cose {

    Bytes encodeBodyHeaders(const BodyHeaders &headers) {
      const size_t count = (headers.content_type ? 1 : 0)
          + (headers.feed ? 1 : 0)
          + (headers.registration_info.empty() ? 0 : 1);
      if (count == 0) {
        return {};
      }
      auto map = cbor::makeMap(count);
      if (headers.content_type) {
        cbor::mapAdd(map.get(),
                     cbor::makeInt(kHeaderContentType),
                     cbor::makeText(*headers.content_type));
      }
      if (headers.feed) {
        cbor::mapAdd(map.get(),
                     cbor::makeInt(kHeaderFeed),
                     cbor::makeText(*headers.feed));
      }
      if (not headers.registration_info.empty()) {
        auto info = cbor::makeMap(headers.registration_info.size());
        for (const auto &entry : headers.registration_info) {
          cbor::mapAdd(
              info.get(), cbor::makeText(entry.name), toCbor(entry.value));
        }
        cbor::mapAdd(map.get(), cbor::makeInt(kHeaderRegistrationInfo), info);
      }
      return cbor::serialize(map.get());
    }

    expected::Result<BodyHeaders, std::string> decodeBodyHeaders(
        ByteRange encoded) {
      CONSIGN_EXPECTED_TRY_GET_VALUE(map, decodeHeaderMap(encoded));
      BodyHeaders headers;
      if (const auto *item = cbor::findInMap(map.get(), kHeaderContentType)) {
        // content formats registered with CoAP are integers
        if (auto format = cbor::asInt(item)) {
          headers.content_type = std::to_string(*format);
        } else {
          CONSIGN_EXPECTED_TRY_GET_VALUE(content_type,
                                         textHeader(item, "content type"));
          headers.content_type = std::move(content_type);
        }
      }
      if (const auto *item = cbor::findInMap(map.get(), kHeaderFeed)) {
        CONSIGN_EXPECTED_TRY_GET_VALUE(feed, textHeader(item, "feed"));
        headers.feed = std::move(feed);
      }
      if (const auto *item =
              cbor::findInMap(map.get(), kHeaderRegistrationInfo)) {
        CONSIGN_EXPECTED_TRY_GET_VALUE(info, decodeRegistrationInfo(item));
        headers.registration_info = std::move(info);
      }
      return expected::makeValue(std::move(headers));
    }

    Bytes encodeSignerHeaders(const SignerHeaders &headers) {
      const size_t count = (headers.algorithm ? 1 : 0)
          + (headers.key_id ? 1 : 0) + (headers.issuer ? 1 : 0);
      if (count == 0) {
        return {};
      }
      auto map = cbor::makeMap(count);
      if (headers.algorithm) {
        cbor::mapAdd(map.get(),
                     cbor::makeInt(kHeaderAlgorithm),
                     cbor::makeInt(*headers.algorithm));
      }
      if (headers.key_id) {
        cbor::mapAdd(map.get(),
                     cbor::makeInt(kHeaderKeyId),
                     cbor::makeBytes(makeByteRange(*headers.key_id)));
      }
      if (headers.issuer) {
        cbor::mapAdd(map.get(),
                     cbor::makeInt(kHeaderIssuer),
                     cbor::makeText(*headers.issuer));
      }
      return cbor::serialize(map.get());
    }

    expected::Result<SignerHeaders, std::string> decodeSignerHeaders(
        ByteRange encoded) {
      CONSIGN_EXPECTED_TRY_GET_VALUE(map, decodeHeaderMap(encoded));
      SignerHeaders headers;
      if (const auto *item = cbor::findInMap(map.get(), kHeaderAlgorithm)) {
        auto algorithm = cbor::asInt(item);
        if (not algorithm) {
          return expected::makeError(
              fmt::format("algorithm header is a {}, expected an integer",
                          cbor::typeName(item)));
        }
        headers.algorithm = *algorithm;
      }
      if (const auto *item = cbor::findInMap(map.get(), kHeaderKeyId)) {
        auto key_id = cbor::asBytes(item);
        if (not key_id) {
          return expected::makeError(
              fmt::format("key id header is a {}, expected a byte string",
                          cbor::typeName(item)));
        }
        headers.key_id = std::string(key_id->begin(), key_id->end());
      }
      if (const auto *item = cbor::findInMap(map.get(), kHeaderIssuer)) {
        CONSIGN_EXPECTED_TRY_GET_VALUE(issuer, textHeader(item, "issuer"));
        headers.issuer = std::move(issuer);
      }
      return expected::makeValue(std::move(headers));
    }

  }  // namespace cose
}  // namespace consign
