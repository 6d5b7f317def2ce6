/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "envelope/cose_sign_message.hpp"

#include <fmt/core.h>
#include "common/result.hpp"
#include "common/result_try.hpp"
#include "envelope/cbor_item.hpp"

namespace {
  using namespace consign;

  constexpr char kSignatureContext[] = "Signature";
  constexpr size_t kCoseSignElements = 4;
  constexpr size_t kCoseSignatureElements = 3;

  expected::Result<cose::CoseSignature, std::string> decodeSignature(
      const cbor_item_t *item, ByteRange encoded) {
    if (not cbor_isa_array(item)
        or cbor_array_size(item) != kCoseSignatureElements) {
      return expected::makeError(
          std::string{"COSE_Signature must be an array of 3 elements"});
    }
    auto **elements = cbor_array_handle(item);
    auto protected_header = cbor::asBytes(elements[0]);
    if (not protected_header) {
      return expected::makeError(
          std::string{"COSE_Signature protected header must be a byte string"});
    }
    if (not cbor_isa_map(elements[1])) {
      return expected::makeError(
          std::string{"COSE_Signature unprotected header must be a map"});
    }
    auto signature = cbor::asBytes(elements[2]);
    if (not signature) {
      return expected::makeError(
          std::string{"COSE_Signature signature must be a byte string"});
    }
    CONSIGN_EXPECTED_TRY_GET_VALUE(
        headers, cose::decodeSignerHeaders(makeByteRange(*protected_header)));
    return expected::makeValue(cose::CoseSignature{std::move(*protected_header),
                                                   std::move(headers),
                                                   std::move(*signature),
                                                   toBytes(encoded)});
  }

  /// Encoded tag, array head, body header, unprotected header and payload
  Bytes encodePrefix(ByteRange body_protected, ByteRange payload) {
    Bytes out;
    cbor::appendTagHead(out, cose::kCoseSignTag);
    cbor::appendArrayHead(out, kCoseSignElements);
    const auto append = [&out](const cbor::ItemPtr &item) {
      const auto encoded = cbor::serialize(item.get());
      out.insert(out.end(), encoded.begin(), encoded.end());
    };
    append(cbor::makeBytes(body_protected));
    append(cbor::makeMap(0));
    append(cbor::makeBytes(payload));
    return out;
  }
}  // namespace

namespace consign {
  namespace cose {

    Bytes makeSigStructure(ByteRange body_protected,
                           ByteRange sign_protected,
                           ByteRange payload) {
      auto structure = cbor::makeArray(5);
      cbor::arrayPush(structure.get(), cbor::makeText(kSignatureContext));
      cbor::arrayPush(structure.get(), cbor::makeBytes(body_protected));
      cbor::arrayPush(structure.get(), cbor::makeBytes(sign_protected));
      cbor::arrayPush(structure.get(), cbor::makeBytes(ByteRange{}));
      cbor::arrayPush(structure.get(), cbor::makeBytes(payload));
      return cbor::serialize(structure.get());
    }

    Bytes encodeCoseSignature(ByteRange sign_protected, ByteRange signature) {
      auto item = cbor::makeArray(kCoseSignatureElements);
      cbor::arrayPush(item.get(), cbor::makeBytes(sign_protected));
      cbor::arrayPush(item.get(), cbor::makeMap(0));
      cbor::arrayPush(item.get(), cbor::makeBytes(signature));
      return cbor::serialize(item.get());
    }

    Bytes encodeCoseSign(ByteRange body_protected,
                         ByteRange payload,
                         const std::vector<Bytes> &signatures) {
      auto out = encodePrefix(body_protected, payload);
      cbor::appendArrayHead(out, signatures.size());
      for (const auto &signature : signatures) {
        out.insert(out.end(), signature.begin(), signature.end());
      }
      return out;
    }

    expected::Result<CoseSignMessage, std::string> decodeCoseSign(
        ByteRange encoded) {
      CONSIGN_EXPECTED_TRY_GET_VALUE(root, cbor::decode(encoded));

      // offset tracks the encoded bytes of the items checked so far
      size_t offset = 0;
      const cbor_item_t *item = root.get();
      cbor::ItemPtr untagged;
      if (cbor_isa_tag(item)) {
        if (cbor_tag_value(item) != kCoseSignTag) {
          return expected::makeError(
              fmt::format("unexpected tag {}, COSE_Sign is tagged {}",
                          cbor_tag_value(item),
                          kCoseSignTag));
        }
        untagged.reset(cbor_tag_item(item));
        item = untagged.get();
        CONSIGN_EXPECTED_TRY_GET_VALUE(tag_head, cbor::headLength(encoded));
        offset += tag_head;
      }

      if (not cbor_isa_array(item)) {
        return expected::makeError(fmt::format(
            "COSE_Sign is a {}, expected an array", cbor::typeName(item)));
      }
      if (cbor_array_size(item) != kCoseSignElements) {
        return expected::makeError(fmt::format(
            "COSE_Sign must be an array of {} elements, got {}",
            kCoseSignElements,
            cbor_array_size(item)));
      }
      auto **elements = cbor_array_handle(item);

      CoseSignMessage message;
      auto body_protected = cbor::asBytes(elements[0]);
      if (not body_protected) {
        return expected::makeError(
            fmt::format("body protected header is a {}, expected a byte string",
                        cbor::typeName(elements[0])));
      }
      message.body_protected = std::move(*body_protected);
      CONSIGN_EXPECTED_TRY_GET_VALUE(
          body_headers, decodeBodyHeaders(makeByteRange(message.body_protected)));
      message.body_headers = std::move(body_headers);

      if (not cbor_isa_map(elements[1])) {
        return expected::makeError(
            fmt::format("unprotected header is a {}, expected a map",
                        cbor::typeName(elements[1])));
      }

      if (cbor_is_null(elements[2])) {
        return expected::makeError(
            std::string{"detached payloads are not supported"});
      }
      auto payload = cbor::asBytes(elements[2]);
      if (not payload) {
        return expected::makeError(
            fmt::format("payload is a {}, expected a byte string",
                        cbor::typeName(elements[2])));
      }
      message.payload = std::move(*payload);

      const auto *signatures = elements[3];
      if (not cbor_isa_array(signatures)) {
        return expected::makeError(
            fmt::format("signatures are a {}, expected an array",
                        cbor::typeName(signatures)));
      }
      if (cbor_array_size(signatures) == 0) {
        return expected::makeError(std::string{"COSE_Sign has no signatures"});
      }

      CONSIGN_EXPECTED_TRY_GET_VALUE(array_head,
                                     cbor::headLength(encoded.substr(offset)));
      offset += array_head;
      for (size_t i = 0; i + 1 < kCoseSignElements; ++i) {
        CONSIGN_EXPECTED_TRY_GET_VALUE(length,
                                       cbor::itemLength(encoded.substr(offset)));
        offset += length;
      }
      message.prefix = toBytes(encoded.substr(0, offset));

      CONSIGN_EXPECTED_TRY_GET_VALUE(signatures_head,
                                     cbor::headLength(encoded.substr(offset)));
      offset += signatures_head;
      auto **signature_items = cbor_array_handle(signatures);
      for (size_t i = 0; i < cbor_array_size(signatures); ++i) {
        CONSIGN_EXPECTED_TRY_GET_VALUE(length,
                                       cbor::itemLength(encoded.substr(offset)));
        auto signature =
            decodeSignature(signature_items[i], encoded.substr(offset, length));
        if (auto error = expected::resultToOptionalError(signature)) {
          return expected::makeError(
              fmt::format("signature {}: {}", i, *error));
        }
        message.signatures.push_back(std::move(signature).assumeValue());
        offset += length;
      }
      return expected::makeValue(std::move(message));
    }

    Bytes appendSignature(const CoseSignMessage &message, ByteRange signature) {
      Bytes out = message.prefix;
      cbor::appendArrayHead(out, message.signatures.size() + 1);
      for (const auto &existing : message.signatures) {
        out.insert(out.end(), existing.encoded.begin(), existing.encoded.end());
      }
      const auto *data = rangeData(signature);
      out.insert(out.end(), data, data + signature.size());
      return out;
    }

  }  // namespace cose
}  // namespace consign
