/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "did/did_signer.hpp"

#include <algorithm>

#include <fmt/core.h>
#include "common/result.hpp"

namespace {
  using consign::DidDocument;
  using consign::SigningError;
  using consign::VerificationMethod;
  using ErrorCode = consign::SigningError::ErrorCode;

  consign::expected::Error<SigningError> didError(std::string message) {
    return consign::expected::makeError(
        SigningError{ErrorCode::kDidResolution, std::move(message)});
  }

  bool idMatches(const std::string &method_id,
                 const std::string &doc_id,
                 const std::string &key_id) {
    if (method_id == key_id) {
      return true;
    }
    if (not key_id.empty() and key_id.front() == '#') {
      return method_id == doc_id + key_id;
    }
    return method_id == doc_id + "#" + key_id;
  }

  bool matchesKey(const VerificationMethod &method,
                  const consign::crypto::PublicKey &public_key) {
    return method.public_key_jwk
        and consign::crypto::jwkMatchesKey(*method.public_key_jwk, public_key);
  }
}  // namespace

namespace consign {

  expected::Result<Signer, SigningError> resolveSignerFromDid(
      crypto::PrivateKey key,
      const DidDocument &document,
      const std::optional<std::string> &key_id) {
    const auto &methods = document.assertion_methods;
    if (methods.empty()) {
      return didError(fmt::format(
          "DID document '{}' has no assertion methods", document.id));
    }

    const auto public_key = key.publicKey();
    const VerificationMethod *selected = nullptr;
    if (key_id) {
      const auto it = std::find_if(
          methods.begin(), methods.end(), [&](const auto &method) {
            return idMatches(method.id, document.id, *key_id);
          });
      if (it == methods.end()) {
        return didError(
            fmt::format("DID document '{}' has no assertion method '{}'",
                        document.id,
                        *key_id));
      }
      selected = &*it;
    } else if (methods.size() == 1) {
      selected = &methods.front();
    } else {
      for (const auto &method : methods) {
        if (matchesKey(method, public_key)) {
          if (selected != nullptr) {
            return didError(fmt::format(
                "several assertion methods of '{}' match the key, pass a key "
                "id to choose one",
                document.id));
          }
          selected = &method;
        }
      }
      if (selected == nullptr) {
        return didError(fmt::format(
            "no assertion method of '{}' matches the key", document.id));
      }
    }

    if (not selected->public_key_jwk) {
      return didError(fmt::format(
          "assertion method '{}' has no publicKeyJwk", selected->id));
    }
    if (not matchesKey(*selected, public_key)) {
      return didError(fmt::format(
          "assertion method '{}' does not match the private key",
          selected->id));
    }

    std::optional<crypto::Algorithm> algorithm;
    if (const auto &name = selected->public_key_jwk->alg) {
      algorithm = crypto::algorithmFromName(*name);
      if (not algorithm) {
        return expected::makeError(SigningError{
            ErrorCode::kUnsupportedAlgorithm,
            fmt::format("'{}' is not a supported algorithm", *name)});
      }
      if (not crypto::isCompatible(*algorithm, key.type())) {
        return expected::makeError(SigningError{
            ErrorCode::kUnsupportedAlgorithm,
            fmt::format("algorithm {} cannot be used with {} key",
                        *name,
                        crypto::keyTypeName(key.type()))});
      }
    }

    auto kid = selected->id;
    if (kid.compare(0, document.id.size(), document.id) == 0) {
      kid.erase(0, document.id.size());
    }

    return expected::makeValue(
        Signer{std::move(key), document.id, std::move(kid), algorithm});
  }

}  // namespace consign
