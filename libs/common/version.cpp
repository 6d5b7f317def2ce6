/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/version.hpp"

#include <ciso646>

namespace consign {

  const char *kPrettyVersion = CONSIGN_PRETTY_VERSION;

  Version getVersion() {
    return Version{
        CONSIGN_MAJOR_VERSION, CONSIGN_MINOR_VERSION, CONSIGN_PATCH_VERSION};
  }

  bool Version::operator==(const Version &rhs) const {
    return major == rhs.major and minor == rhs.minor and patch == rhs.patch;
  }

}  // namespace consign
