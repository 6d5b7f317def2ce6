/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "envelope/registration_info.hpp"

#include <algorithm>
#include <charconv>
#include <regex>

#include <fmt/core.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/files.hpp"
#include "common/result.hpp"
#include "common/utf8.hpp"

namespace {
  using consign::SigningError;
  using ErrorCode = consign::SigningError::ErrorCode;

  // names cannot contain '=' or ':', there is no escaping
  const std::regex kArgumentPattern("(([^=:]+):)?([^=:]+)=([^\\n]*)");
  const std::regex kIntegerPattern("[+-]?[0-9]+");

  consign::expected::Result<int64_t, SigningError> parseInteger(
      const std::string &name, std::string text) {
    boost::algorithm::trim_if(text, [](char c) {
      return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\f'
          or c == '\v';
    });
    const auto not_an_integer = [&] {
      return consign::expected::makeError(SigningError{
          ErrorCode::kTypeCoercion,
          fmt::format("value of '{}' is not a 64-bit integer: '{}'",
                      name,
                      text)});
    };
    if (not std::regex_match(text, kIntegerPattern)) {
      return not_an_integer();
    }
    const char *begin = text.data() + (text.front() == '+' ? 1 : 0);
    const char *end = text.data() + text.size();
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} or ptr != end) {
      return not_an_integer();
    }
    return consign::expected::makeValue(value);
  }
}  // namespace

namespace consign {

  std::string registrationInfoTypeName(RegistrationInfoType type) {
    switch (type) {
      case RegistrationInfoType::kText:
        return "text";
      case RegistrationInfoType::kBytes:
        return "bytes";
      case RegistrationInfoType::kInt:
        return "int";
    }
    return "unknown";
  }

  std::optional<RegistrationInfoType> registrationInfoTypeFromName(
      const std::string &name) {
    for (auto type : {RegistrationInfoType::kText,
                      RegistrationInfoType::kBytes,
                      RegistrationInfoType::kInt}) {
      if (registrationInfoTypeName(type) == name) {
        return type;
      }
    }
    return std::nullopt;
  }

  std::string RegistrationInfoArgument::toString() const {
    return fmt::format("{}:{}={}", registrationInfoTypeName(type), name, content);
  }

  expected::Result<RegistrationInfoArgument, SigningError>
  parseRegistrationInfoArgument(const std::string &raw) {
    std::smatch match;
    if (not std::regex_match(raw, match, kArgumentPattern)) {
      return expected::makeError(SigningError{
          ErrorCode::kArgumentFormat,
          fmt::format("'{}' is not a valid registration info argument", raw)});
    }

    RegistrationInfoArgument argument{
        RegistrationInfoType::kText, match[3].str(), match[4].str()};
    if (match[2].matched) {
      auto type = registrationInfoTypeFromName(match[2].str());
      if (not type) {
        return expected::makeError(SigningError{
            ErrorCode::kArgumentFormat,
            fmt::format("'{}' is not a valid registration info type",
                        match[2].str())});
      }
      argument.type = *type;
    }
    return expected::makeValue(std::move(argument));
  }

  expected::Result<RegistrationInfoEntry, SigningError> resolveRegistrationInfo(
      const RegistrationInfoArgument &argument) {
    Bytes data;
    if (not argument.content.empty() and argument.content.front() == '@') {
      auto file = readBinaryFile(argument.content.substr(1));
      if (auto error = expected::resultToOptionalError(file)) {
        return expected::makeError(
            SigningError{ErrorCode::kFileAccess, std::move(*error)});
      }
      data = std::move(file).assumeValue();
    } else {
      if (not isAscii(makeByteRange(argument.content))) {
        return expected::makeError(SigningError{
            ErrorCode::kTypeCoercion,
            fmt::format("inline value of '{}' is not ASCII, pass non-ASCII "
                        "content with @file",
                        argument.name)});
      }
      data.assign(argument.content.begin(), argument.content.end());
    }

    if (argument.type == RegistrationInfoType::kBytes) {
      return expected::makeValue(RegistrationInfoEntry{
          argument.type, argument.name, RegistrationInfoValue{std::move(data)}});
    }

    if (not isValidUtf8(makeByteRange(data))) {
      return expected::makeError(SigningError{
          ErrorCode::kTypeCoercion,
          fmt::format("value of '{}' is not valid UTF-8", argument.name)});
    }
    std::string text(data.begin(), data.end());

    if (argument.type == RegistrationInfoType::kInt) {
      return parseInteger(argument.name, std::move(text)) |
          [&argument](int64_t value) {
            return RegistrationInfoEntry{
                argument.type, argument.name, RegistrationInfoValue{value}};
          };
    }
    return expected::makeValue(RegistrationInfoEntry{
        argument.type, argument.name, RegistrationInfoValue{std::move(text)}});
  }

  expected::Result<RegistrationInfoEntry, SigningError> parseRegistrationInfo(
      const std::string &raw) {
    return parseRegistrationInfoArgument(raw) |
        [](const auto &argument) { return resolveRegistrationInfo(argument); };
  }

  RegistrationInfo foldRegistrationInfo(const RegistrationInfo &entries) {
    RegistrationInfo folded;
    for (const auto &entry : entries) {
      auto existing = std::find_if(
          folded.begin(), folded.end(), [&entry](const auto &e) {
            return e.name == entry.name;
          });
      if (existing != folded.end()) {
        *existing = entry;
      } else {
        folded.push_back(entry);
      }
    }
    return folded;
  }

}  // namespace consign
