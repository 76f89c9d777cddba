/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace rollup {
  /**
   * @returns version of the node, set by build system
   */
  const std::string &buildVersion();
}  // namespace rollup
