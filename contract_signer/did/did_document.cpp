/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "did/did_document.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/rapidjson.h>
#include "common/result.hpp"

/// The length of the string around the error place to print in case of JSON
/// syntax error.
static constexpr size_t kBadJsonPrintLength = 15;

/// The offset of printed chunk towards file start from the error position.
static constexpr size_t kBadJsonPrintOffset = 5;

static_assert(kBadJsonPrintOffset <= kBadJsonPrintLength,
              "The place of error is out of the printed string boundaries!");

namespace {
  using consign::DidDocument;
  using consign::VerificationMethod;
  using consign::crypto::Jwk;

  class DidParsingException : public std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /**
   * Throws a parsing exception if the given condition is false.
   * @param condition
   * @param error - error message
   */
  inline void assert_fatal(bool condition,
                           std::string_view printable_path,
                           std::string error) {
    if (!condition) {
      throw DidParsingException(fmt::format("{}: {}", printable_path, error));
    }
  }

  void reportJsonParsingError(const rapidjson::Document &doc,
                              const std::string &text) {
    if (doc.HasParseError()) {
      const size_t error_offset = doc.GetErrorOffset();
      // This ensures the unsigned string beginning position does not cross
      // zero:
      const size_t print_offset =
          std::max(error_offset, kBadJsonPrintOffset) - kBadJsonPrintOffset;
      std::string json_error_buf = text.substr(print_offset, kBadJsonPrintLength);
      throw DidParsingException{fmt::format(
          "JSON parse error (near `{}'): {}",
          json_error_buf,
          std::string(rapidjson::GetParseError_En(doc.GetParseError())))};
    }
  }

  std::string getString(const rapidjson::Value &object,
                        const char *key,
                        const std::string &path) {
    const auto it = object.FindMember(key);
    assert_fatal(it != object.MemberEnd(),
                 path,
                 fmt::format("missing required member `{}'", key));
    assert_fatal(it->value.IsString(),
                 path,
                 fmt::format("member `{}' must be a string", key));
    return std::string(it->value.GetString(), it->value.GetStringLength());
  }

  std::optional<std::string> getOptString(const rapidjson::Value &object,
                                          const char *key,
                                          const std::string &path) {
    if (not object.HasMember(key)) {
      return std::nullopt;
    }
    return getString(object, key, path);
  }

  /// Relative "#fragment" references are resolved against the document id
  std::string absoluteId(const std::string &id, const std::string &doc_id) {
    return not id.empty() and id.front() == '#' ? doc_id + id : id;
  }

  Jwk loadJwk(const rapidjson::Value &value, const std::string &path) {
    assert_fatal(value.IsObject(), path, "must be an object");
    Jwk jwk;
    jwk.kty = getString(value, "kty", path);
    jwk.crv = getOptString(value, "crv", path);
    jwk.x = getOptString(value, "x", path);
    jwk.y = getOptString(value, "y", path);
    jwk.n = getOptString(value, "n", path);
    jwk.e = getOptString(value, "e", path);
    jwk.alg = getOptString(value, "alg", path);
    return jwk;
  }

  VerificationMethod loadMethod(const rapidjson::Value &value,
                                const std::string &doc_id,
                                const std::string &path) {
    assert_fatal(value.IsObject(), path, "must be an object");
    VerificationMethod method;
    method.id = absoluteId(getString(value, "id", path), doc_id);
    method.type = getString(value, "type", path);
    method.controller = getOptString(value, "controller", path);
    const auto jwk = value.FindMember("publicKeyJwk");
    if (jwk != value.MemberEnd()) {
      method.public_key_jwk = loadJwk(jwk->value, path + "/publicKeyJwk");
    }
    return method;
  }

  DidDocument loadDocument(const rapidjson::Value &root) {
    assert_fatal(root.IsObject(), "/", "DID document must be a JSON object");
    DidDocument doc;
    doc.id = getString(root, "id", "/");

    const auto methods = root.FindMember("verificationMethod");
    if (methods != root.MemberEnd()) {
      assert_fatal(
          methods->value.IsArray(), "/verificationMethod", "must be an array");
      for (rapidjson::SizeType i = 0; i < methods->value.Size(); ++i) {
        doc.verification_methods.push_back(
            loadMethod(methods->value[i],
                       doc.id,
                       fmt::format("/verificationMethod/{}", i)));
      }
    }

    const auto assertions = root.FindMember("assertionMethod");
    if (assertions != root.MemberEnd()) {
      assert_fatal(
          assertions->value.IsArray(), "/assertionMethod", "must be an array");
      for (rapidjson::SizeType i = 0; i < assertions->value.Size(); ++i) {
        const auto &entry = assertions->value[i];
        const auto path = fmt::format("/assertionMethod/{}", i);
        if (entry.IsString()) {
          const auto ref = absoluteId(
              std::string(entry.GetString(), entry.GetStringLength()), doc.id);
          const auto it = std::find_if(doc.verification_methods.begin(),
                                       doc.verification_methods.end(),
                                       [&ref](const auto &method) {
                                         return method.id == ref;
                                       });
          assert_fatal(it != doc.verification_methods.end(),
                       path,
                       fmt::format("`{}' is not a verification method", ref));
          doc.assertion_methods.push_back(*it);
        } else {
          doc.assertion_methods.push_back(loadMethod(entry, doc.id, path));
        }
      }
    }
    return doc;
  }
}  // namespace

namespace consign {

  expected::Result<DidDocument, std::string> parseDidDocument(
      const std::string &text) {
    try {
      rapidjson::Document doc;
      doc.Parse(text.data(), text.size());
      reportJsonParsingError(doc, text);
      return expected::makeValue(loadDocument(doc));
    } catch (DidParsingException const &e) {
      return expected::makeError(std::string{e.what()});
    }
  }

}  // namespace consign
