/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/files.hpp"

#include <ciso646>
#include <fstream>

#include <fmt/core.h>
#include <boost/filesystem.hpp>
#include "common/result.hpp"

namespace {
  template <typename T>
  consign::expected::Result<T, std::string> readFile(
      const boost::filesystem::path &path, std::ios_base::openmode mode) {
    boost::system::error_code error_code;
    const auto status = boost::filesystem::status(path, error_code);
    if (not boost::filesystem::exists(status)) {
      return consign::expected::makeError(
          fmt::format("File '{}' does not exist.", path.string()));
    }
    if (error_code) {
      return consign::expected::makeError(
          fmt::format("File '{}' could not be read: {}.",
                      path.string(),
                      error_code.message()));
    }
    if (not boost::filesystem::is_regular_file(status)) {
      return consign::expected::makeError(
          fmt::format("File '{}' is not a regular file.", path.string()));
    }

    std::ifstream file(path.string(), mode);
    if (!file) {
      return consign::expected::makeError(
          fmt::format("File '{}' could not be read.", path.string()));
    }

    try {
      T contents((std::istreambuf_iterator<char>(file)),
                 std::istreambuf_iterator<char>());
      if (file.bad()) {
        return consign::expected::makeError(
            fmt::format("Error while reading file '{}'.", path.string()));
      }
      return consign::expected::makeValue(std::move(contents));
    } catch (const std::ios_base::failure &e) {
      // the file buffer throws on read errors regardless of the stream mask
      return consign::expected::makeError(fmt::format(
          "Error while reading file '{}': {}", path.string(), e.what()));
    }
  }
}  // namespace

consign::expected::Result<std::string, std::string> consign::readTextFile(
    const boost::filesystem::path &path) {
  return readFile<std::string>(path, std::ios_base::in);
}

consign::expected::Result<std::vector<uint8_t>, std::string>
consign::readBinaryFile(const boost::filesystem::path &path) {
  return readFile<std::vector<uint8_t>>(
      path, std::ios_base::binary | std::ios_base::in);
}

consign::expected::Result<void, std::string> consign::writeFileAtomically(
    const boost::filesystem::path &path, ByteRange data) {
  namespace fs = boost::filesystem;
  boost::system::error_code error_code;

  auto directory = path.parent_path();
  if (directory.empty()) {
    directory = fs::current_path(error_code);
    if (error_code) {
      return expected::makeError(error_code.message());
    }
  }
  const fs::path temp_path =
      directory / fs::unique_path(path.filename().string() + ".%%%%-%%%%.tmp");

  {
    std::ofstream file(temp_path.string(),
                       std::ios_base::binary | std::ios_base::trunc);
    if (not file) {
      return expected::makeError(fmt::format(
          "File '{}' could not be opened for writing.", temp_path.string()));
    }
    file.write(reinterpret_cast<const char *>(data.data()), data.size());
    file.close();
    if (not file) {
      fs::remove(temp_path, error_code);
      return expected::makeError(
          fmt::format("Could not write file '{}'.", temp_path.string()));
    }
  }

  fs::rename(temp_path, path, error_code);
  if (error_code) {
    auto message = fmt::format("Could not move '{}' to '{}': {}",
                               temp_path.string(),
                               path.string(),
                               error_code.message());
    fs::remove(temp_path, error_code);
    return expected::makeError(std::move(message));
  }
  return expected::makeValue();
}
