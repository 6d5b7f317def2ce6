/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_VERSION_HPP
#define CONSIGN_VERSION_HPP

// disabling GNU macros
#ifdef major
#undef major
#endif

#ifdef minor
#undef minor
#endif

namespace consign {

  /// A string describing the current version in a human-readable way
  extern const char *kPrettyVersion;

  struct Version {
    unsigned int major;
    unsigned int minor;
    unsigned int patch;

    bool operator==(const Version &) const;
  };

  Version getVersion();

}  // namespace consign

#endif  // CONSIGN_VERSION_HPP
