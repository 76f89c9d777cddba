/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/byte_vec.hpp>

#include "types/block_hash.hpp"

namespace rollup {

  /**
   * Batch of layer-2 transactions built by the sequencer. Its encoding is
   * owned by the derivation pipeline and the batch submitter.
   */
  struct BatchData {
    // number of the layer-1 origin the batch is anchored to
    BlockNumber epoch = 0;
    TimestampSeconds timestamp = 0;
    std::vector<qtils::ByteVec> transactions;

    bool operator==(const BatchData &) const = default;
  };

}  // namespace rollup
