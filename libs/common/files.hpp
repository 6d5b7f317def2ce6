/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_FILES_HPP
#define CONSIGN_FILES_HPP

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"

/**
 * This source file contains common methods related to files
 */
namespace consign {

  /**
   * Read file in text mode, and either return its contents as a string
   * or return the error as a string
   * @param path - path to the file
   */
  expected::Result<std::string, std::string> readTextFile(
      const boost::filesystem::path &path);

  /**
   * Read file in binary mode, and either return its contents as a byte vector
   * or return the error as a string
   * @param path - path to the file
   */
  expected::Result<std::vector<uint8_t>, std::string> readBinaryFile(
      const boost::filesystem::path &path);

  /**
   * Write data to a temporary file next to the target, then rename it over
   * the target. On any failure the target is left untouched and the
   * temporary file is removed.
   * @param path - destination path
   * @param data - file contents
   */
  expected::Result<void, std::string> writeFileAtomically(
      const boost::filesystem::path &path, ByteRange data);
}  // namespace consign
#endif  // CONSIGN_FILES_HPP
