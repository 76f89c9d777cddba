/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/outcome.hpp>

#include "types/batch_data.hpp"
#include "types/rollup_config.hpp"

namespace rollup::driver {

  class BatchSubmitter {
   public:
    virtual ~BatchSubmitter() = default;

    /**
     * Sends batches to the layer-1 batch inbox
     * @return hash of the submitting transaction
     */
    virtual outcome::result<TxHash> submit(
        const RollupConfig &config, const std::vector<BatchData> &batches) = 0;
  };

}  // namespace rollup::driver
