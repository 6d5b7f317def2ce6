/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_REGISTRATION_INFO_HPP
#define CONSIGN_REGISTRATION_INFO_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/variant.hpp>
#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"
#include "error/signing_error.hpp"

namespace consign {

  enum class RegistrationInfoType {
    kText,
    kBytes,
    kInt,
  };

  /// @return prefix used on the command line: "text", "bytes" or "int"
  std::string registrationInfoTypeName(RegistrationInfoType type);

  std::optional<RegistrationInfoType> registrationInfoTypeFromName(
      const std::string &name);

  using RegistrationInfoValue = boost::variant<std::string, Bytes, int64_t>;

  /**
   * Registration info entry as given on the command line, before the content
   * has been read and converted.
   */
  struct RegistrationInfoArgument {
    RegistrationInfoType type;
    std::string name;
    /// inline ASCII content, or "@path" naming a file with the raw content
    std::string content;

    /// @return "type:name=content"
    std::string toString() const;
  };

  struct RegistrationInfoEntry {
    RegistrationInfoType type;
    std::string name;
    RegistrationInfoValue value;
  };

  using RegistrationInfo = std::vector<RegistrationInfoEntry>;

  /**
   * Split a "[type:]name=content" string. The type defaults to text, the
   * name may contain neither '=' nor ':', the content may be empty.
   * @return argument or kArgumentFormat error
   */
  expected::Result<RegistrationInfoArgument, SigningError>
  parseRegistrationInfoArgument(const std::string &raw);

  /**
   * Read the content (from a file for "@path") and convert it to the
   * declared type.
   * @return entry, kFileAccess error for unreadable files or kTypeCoercion
   * error for content that does not fit the type
   */
  expected::Result<RegistrationInfoEntry, SigningError> resolveRegistrationInfo(
      const RegistrationInfoArgument &argument);

  /// parseRegistrationInfoArgument followed by resolveRegistrationInfo
  expected::Result<RegistrationInfoEntry, SigningError> parseRegistrationInfo(
      const std::string &raw);

  /**
   * Merge entries sharing a name: the last value wins, the name keeps the
   * position of its first occurrence.
   */
  RegistrationInfo foldRegistrationInfo(const RegistrationInfo &entries);

}  // namespace consign

#endif  // CONSIGN_REGISTRATION_INFO_HPP
