/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef ROLLUP_NODE_VERSION
#define ROLLUP_NODE_VERSION "unknown"
#endif

namespace rollup {
  const std::string &buildVersion() {
    static const std::string version{ROLLUP_NODE_VERSION};
    return version;
  }
}  // namespace rollup
