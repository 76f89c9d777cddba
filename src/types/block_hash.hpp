/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/byte_arr.hpp>

namespace rollup {
  using BlockHash = qtils::ByteArr<32>;
  using TxHash = qtils::ByteArr<32>;

  using BlockNumber = uint64_t;
  using TimestampSeconds = uint64_t;

}  // namespace rollup
