/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <optional>
#include <vector>

#include <qtils/outcome.hpp>

#include "log/logger.hpp"
#include "types/block_id.hpp"

namespace rollup::driver {
  class L1Chain;

  /**
   * Buffer of the layer-1 blocks following the l1 origin of the safe head,
   * consumed one sequencing window at a time.
   *
   * Entries are contiguous and strictly ascending by number. Whenever the
   * layer-1 chain reorganizes the buffer must be cleared.
   */
  class L1Window {
   public:
    explicit L1Window(log::Logger logger);

    /**
     * @param origin l1 origin of the safe head
     * @return last buffered block, or {@param origin} if the buffer is empty
     */
    [[nodiscard]] const BlockId &end(const BlockId &origin) const;

    /**
     * Pulls all canonical blocks following `end(origin)` from layer-1.
     * On failure the buffer stays unchanged.
     */
    outcome::result<void> extend(const L1Chain &l1, const BlockId &origin);

    /**
     * Appends a new layer-1 head if it is the direct child of the last
     * buffered block
     * @return true if the head was appended
     */
    bool append(const L1BlockRef &head, const BlockId &origin);

    /**
     * @return first {@param size} buffered blocks, or std::nullopt if there
     * are fewer
     */
    [[nodiscard]] std::optional<std::vector<BlockId>> windowFor(
        size_t size) const;

    /// Drops the first buffered block
    void evictFront();

    void clear();

    [[nodiscard]] size_t size() const {
      return entries_.size();
    }

    [[nodiscard]] bool empty() const {
      return entries_.empty();
    }

    [[nodiscard]] const std::deque<BlockId> &entries() const {
      return entries_;
    }

   private:
    log::Logger logger_;
    std::deque<BlockId> entries_;
  };

}  // namespace rollup::driver
