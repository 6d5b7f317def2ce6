/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_CONTRACT_SIGNER_HPP
#define CONSIGN_CONTRACT_SIGNER_HPP

#include <optional>
#include <string>

#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"
#include "envelope/registration_info.hpp"
#include "error/signing_error.hpp"
#include "logger/logger_fwd.hpp"
#include "signing/signer.hpp"

namespace consign {

  /**
   * Produces COSE_Sign envelopes around contracts.
   */
  class ContractSigner {
   public:
    explicit ContractSigner(logger::LoggerPtr log);

    /**
     * Sign a contract.
     * @param signer - key and identity of the signing party
     * @param contract - contract bytes, or an existing envelope when
     * add_signature is set
     * @param content_type - media type of the contract
     * @param add_signature - append a signature to an existing envelope
     * instead of creating a new one
     * @param feed - optional feed stored in the body header
     * @param registration_info - entries stored in the body header, folded
     * by name
     * @return encoded envelope. In append mode content_type, feed and
     * registration_info are ignored and the existing envelope is kept
     * byte for byte apart from the signatures array
     */
    expected::Result<Bytes, SigningError> sign(
        const Signer &signer,
        ByteRange contract,
        const std::string &content_type,
        bool add_signature,
        const std::optional<std::string> &feed,
        const RegistrationInfo &registration_info) const;

   private:
    expected::Result<Bytes, SigningError> createEnvelope(
        const Signer &signer,
        ByteRange contract,
        const std::string &content_type,
        const std::optional<std::string> &feed,
        const RegistrationInfo &registration_info) const;

    expected::Result<Bytes, SigningError> addSignature(
        const Signer &signer, ByteRange envelope) const;

    /**
     * Sign the body of a message and encode the resulting COSE_Signature.
     */
    expected::Result<Bytes, SigningError> makeSignature(
        const Signer &signer,
        ByteRange body_protected,
        ByteRange payload) const;

    logger::LoggerPtr log_;
  };

}  // namespace consign

#endif  // CONSIGN_CONTRACT_SIGNER_HPP
