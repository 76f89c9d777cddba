/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/formatters/block_id_ref.hpp"
#include "types/block_hash.hpp"

namespace rollup {

  /**
   * Identifies a block on either chain without its content
   */
  struct BlockId {
    BlockHash hash;
    BlockNumber number = 0;

    bool operator==(const BlockId &other) const = default;
  };

  /**
   * Header view of a layer-1 block
   */
  struct L1BlockRef {
    BlockId self;
    BlockId parent;
    TimestampSeconds time = 0;

    bool operator==(const L1BlockRef &other) const = default;
  };

  /**
   * Header view of a layer-2 block together with the layer-1 block its
   * derivation is anchored to
   */
  struct L2BlockRef {
    BlockId self;
    TimestampSeconds time = 0;
    BlockId l1_origin;

    bool operator==(const L2BlockRef &other) const = default;
  };

}  // namespace rollup

template <>
struct fmt::formatter<rollup::BlockId> : fmt::formatter<rollup::BlockIdRef> {
  template <typename FormatContext>
  auto format(const rollup::BlockId &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<rollup::BlockIdRef>::format(
        rollup::BlockIdRef{v.number, v.hash}, ctx);
  }
};

template <>
struct fmt::formatter<rollup::L1BlockRef>
    : fmt::formatter<rollup::BlockIdRef> {
  template <typename FormatContext>
  auto format(const rollup::L1BlockRef &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    auto out = fmt::formatter<rollup::BlockIdRef>::format(
        rollup::BlockIdRef{v.self.number, v.self.hash}, ctx);
    return fmt::format_to(out, " (time {})", v.time);
  }
};

template <>
struct fmt::formatter<rollup::L2BlockRef>
    : fmt::formatter<rollup::BlockIdRef> {
  template <typename FormatContext>
  auto format(const rollup::L2BlockRef &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    auto out = fmt::formatter<rollup::BlockIdRef>::format(
        rollup::BlockIdRef{v.self.number, v.self.hash}, ctx);
    return fmt::format_to(
        out, " (time {}, l1 origin {})", v.time, v.l1_origin.number);
  }
};
