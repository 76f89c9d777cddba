/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "driver/l1_window.hpp"

#include "driver/driver_error.hpp"
#include "driver/l1_chain.hpp"

namespace rollup::driver {

  L1Window::L1Window(log::Logger logger) : logger_(std::move(logger)) {}

  const BlockId &L1Window::end(const BlockId &origin) const {
    if (entries_.empty()) {
      return origin;
    }
    return entries_.back();
  }

  outcome::result<void> L1Window::extend(const L1Chain &l1,
                                         const BlockId &origin) {
    const auto tail = end(origin);
    SL_TRACE(logger_,
             "Extending the cached window from L1; cached_size={} "
             "window_end={}",
             entries_.size(),
             tail);

    auto range_res = l1.rangeAfter(tail);
    if (range_res.has_error()) {
      SL_DEBUG(logger_,
               "Could not fetch L1 blocks after {}: {}",
               tail,
               range_res.error());
      return DriverError::L1_RETRIEVAL_FAILED;
    }
    auto &range = range_res.value();

    auto expected = tail.number + 1;
    for (const auto &id : range) {
      if (id.number != expected) {
        SL_DEBUG(logger_,
                 "L1 range after {} is not contiguous: got {} instead of "
                 "number {}",
                 tail,
                 id,
                 expected);
        return DriverError::L1_RANGE_NOT_CONTIGUOUS;
      }
      ++expected;
    }

    entries_.insert(entries_.end(), range.begin(), range.end());
    return outcome::success();
  }

  bool L1Window::append(const L1BlockRef &head, const BlockId &origin) {
    if (end(origin) != head.parent) {
      return false;
    }
    entries_.push_back(head.self);
    return true;
  }

  std::optional<std::vector<BlockId>> L1Window::windowFor(size_t size) const {
    if (size == 0 or entries_.size() < size) {
      return std::nullopt;
    }
    return std::vector<BlockId>(entries_.begin(),
                                entries_.begin() + static_cast<long>(size));
  }

  void L1Window::evictFront() {
    if (not entries_.empty()) {
      entries_.pop_front();
    }
  }

  void L1Window::clear() {
    entries_.clear();
  }

}  // namespace rollup::driver
