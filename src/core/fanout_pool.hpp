/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "core/status.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace workpool::core {

// Helper pool for data-parallel submission. It never runs dispatch jobs itself;
// callers use it to push many items into a job channel from several threads.
//
// Several callers may run for_each_range() on one pool at the same time. Each
// call only waits for, and only reports failures of, its own ranges.
class FanoutPool {
public:
  using RangeFn = std::function<Status(std::size_t begin, std::size_t end)>;

  explicit FanoutPool(std::size_t thread_count);
  ~FanoutPool();

  FanoutPool(const FanoutPool&) = delete;
  FanoutPool& operator=(const FanoutPool&) = delete;

  // Splits [0, n) into at most threads() contiguous ranges, runs fn(begin, end)
  // for each of them on the pool threads and waits for all of them. Returns the
  // first failure; an exception thrown by fn counts as a failure.
  Status for_each_range(std::size_t n, const RangeFn& fn) noexcept;

  // Pool threads exit once the ranges already queued are done. Later
  // for_each_range() calls fail.
  void stop() noexcept;

  std::size_t threads() const noexcept { return threads_.size(); }

private:
  struct Batch;

  struct Range {
    std::shared_ptr<Batch> batch;
    const RangeFn* fn = nullptr;
    std::size_t begin = 0;
    std::size_t end = 0;
  };

  static void run_range_(const Range& r) noexcept;
  void thread_loop_() noexcept;

  std::vector<std::thread> threads_;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Range> ranges_;
  bool stopping_ = false;
};

} // namespace workpool::core
