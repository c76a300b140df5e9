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


#include "core/fanout_pool.hpp"

#include <algorithm>
#include <exception>
#include <new>
#include <utility>

#include <spdlog/spdlog.h>

namespace workpool::core {

// Completion state of one for_each_range() call.
struct FanoutPool::Batch {
  std::mutex mtx;
  std::condition_variable cv;
  std::size_t remaining = 0;
  Status first_error{};

  void finish(Status st) noexcept {
    std::lock_guard lk(mtx);
    if (!st.ok && first_error.ok) first_error = std::move(st);
    if (--remaining == 0) cv.notify_all();
  }
};

FanoutPool::FanoutPool(std::size_t thread_count) {
  if (thread_count == 0) thread_count = 1;
  threads_.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) threads_.emplace_back([this] { thread_loop_(); });
}

FanoutPool::~FanoutPool() {
  stop();
  for (auto& t : threads_) if (t.joinable()) t.join();
}

Status FanoutPool::for_each_range(std::size_t n, const RangeFn& fn) noexcept {
  if (n == 0) return Status::Ok();

  const std::size_t parts = std::min(n, threads_.size());
  const std::size_t step = n / parts;
  const std::size_t extra = n % parts;

  std::shared_ptr<Batch> batch;
  try {
    batch = std::make_shared<Batch>();
  } catch (const std::bad_alloc&) {
    return Status::Fail("FanoutPool: out of memory");
  }
  batch->remaining = parts;

  {
    std::lock_guard lk(mtx_);
    if (stopping_) return Status::Fail("FanoutPool: pool is stopping");

    std::size_t begin = 0;
    for (std::size_t p = 0; p < parts; ++p) {
      const std::size_t end = begin + step + (p < extra ? 1 : 0);
      try {
        ranges_.push_back(Range{batch, &fn, begin, end});
      } catch (const std::bad_alloc&) {
        // Ranges that were never queued still count down so the wait below ends.
        for (std::size_t q = p; q < parts; ++q)
          batch->finish(q == p ? Status::Fail("FanoutPool: out of memory") : Status::Ok());
        break;
      }
      begin = end;
    }
  }
  cv_.notify_all();

  std::unique_lock lk(batch->mtx);
  batch->cv.wait(lk, [&] { return batch->remaining == 0; });
  return batch->first_error;
}

void FanoutPool::stop() noexcept {
  {
    std::lock_guard lk(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
}

void FanoutPool::run_range_(const Range& r) noexcept {
  try {
    r.batch->finish((*r.fn)(r.begin, r.end));
  } catch (const std::exception& e) {
    spdlog::debug("FanoutPool range [{}, {}) threw: {}", r.begin, r.end, e.what());
    r.batch->finish(Status::Fail(e.what()));
  } catch (...) {
    spdlog::debug("FanoutPool range [{}, {}) threw unknown exception", r.begin, r.end);
    r.batch->finish(Status::Fail("Unknown exception in FanoutPool range"));
  }
}

void FanoutPool::thread_loop_() noexcept {
  std::unique_lock lk(mtx_);
  for (;;) {
    cv_.wait(lk, [&] { return stopping_ || !ranges_.empty(); });
    if (ranges_.empty()) return;

    Range r = std::move(ranges_.front());
    ranges_.pop_front();

    lk.unlock();
    run_range_(r);
    lk.lock();
  }
}

} // namespace workpool::core
