/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/files.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include "common/result.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_keys.hpp"

namespace fs = boost::filesystem;

namespace {
  const std::string kText =
      "Ohne Sinnlichkeit würde uns kein Gegenstand gegeben,\n"
      "und ohne Verstand keiner gedacht werden.\n";

  const std::vector<uint8_t> kBlob{
      0xe0, 0x00, 0x45, 0x00, 0x3a, 0x00, 0x00, 0x23, 0x9a, 0xe6, 0xd8, 0xc8,
      0x3a, 0x20, 0x42, 0x37, 0x43, 0xe6, 0x80, 0x39, 0x03, 0x4b, 0x23, 0xdb,
      0xc1, 0xea, 0x5b, 0x80, 0x17, 0xad, 0x37, 0xaa, 0x4b, 0x6c, 0x00, 0x00};
}  // namespace

class FilesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    text_file_path_ = temp_dir_ / "text";
    bin_file_path_ = temp_dir_ / "binary";
    nonexistent_file_path_ = temp_dir_ / "nonexistent";

    framework::writeTestFile(text_file_path_, kText);
    framework::writeTestFile(
        bin_file_path_,
        std::string_view(reinterpret_cast<const char *>(kBlob.data()),
                         kBlob.size()));
  }

  framework::TemporaryDirectory temp_dir_;
  fs::path text_file_path_;
  fs::path bin_file_path_;
  fs::path nonexistent_file_path_;
};

TEST_F(FilesTest, TextFile) {
  auto result = consign::readTextFile(text_file_path_);
  CONSIGN_ASSERT_RESULT_VALUE(result) << "Could not read " << text_file_path_;
  EXPECT_EQ(result.assumeValue(), kText);
}

TEST_F(FilesTest, BinaryFile) {
  auto result = consign::readBinaryFile(bin_file_path_);
  CONSIGN_ASSERT_RESULT_VALUE(result) << "Could not read " << bin_file_path_;
  EXPECT_EQ(result.assumeValue(), kBlob);
}

TEST_F(FilesTest, NonexistentFile) {
  ASSERT_FALSE(fs::exists(nonexistent_file_path_));
  auto result = consign::readBinaryFile(nonexistent_file_path_);
  CONSIGN_ASSERT_RESULT_ERROR(result);
}

/**
 * @given a directory
 * @when it is read as a file
 * @then an error is returned instead of a stream failure
 */
TEST_F(FilesTest, DirectoryIsNotReadable) {
  auto binary = consign::readBinaryFile(temp_dir_.path());
  CONSIGN_ASSERT_RESULT_ERROR(binary);
  EXPECT_NE(binary.assumeError().find("is not a regular file"),
            std::string::npos);
  CONSIGN_ASSERT_RESULT_ERROR(consign::readTextFile(temp_dir_.path()));
}

/**
 * @given an existing file
 * @when it is written atomically with new contents
 * @then the file holds exactly the new contents and no temporary file is left
 */
TEST_F(FilesTest, WriteAtomicallyReplacesContents) {
  auto result = consign::writeFileAtomically(text_file_path_,
                                             consign::makeByteRange(kBlob));
  CONSIGN_ASSERT_RESULT_VALUE(result);

  auto written = consign::readBinaryFile(text_file_path_);
  CONSIGN_ASSERT_RESULT_VALUE(written);
  EXPECT_EQ(written.assumeValue(), kBlob);

  size_t entries = 0;
  for (fs::directory_iterator it(temp_dir_.path()), end; it != end; ++it) {
    ++entries;
  }
  EXPECT_EQ(entries, 2);
}

/**
 * @given a path inside a missing directory
 * @when a file is written atomically there
 * @then an error is returned and nothing is created
 */
TEST_F(FilesTest, WriteAtomicallyToMissingDirectory) {
  const auto path = temp_dir_ / "missing" / "out.cose";
  auto result =
      consign::writeFileAtomically(path, consign::makeByteRange(kBlob));
  CONSIGN_ASSERT_RESULT_ERROR(result);
  EXPECT_FALSE(fs::exists(path));
}
