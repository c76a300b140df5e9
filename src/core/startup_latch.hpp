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

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace workpool::core {

// Countdown barrier for thread startup. Every participant reports exactly once,
// either ready or failed; wait() returns when `expected` reports are in.
class StartupLatch {
public:
  struct Tally {
    std::size_t ready = 0;
    std::size_t failed = 0;
  };

  explicit StartupLatch(std::size_t expected) noexcept : expected_(expected) {}

  StartupLatch(const StartupLatch&) = delete;
  StartupLatch& operator=(const StartupLatch&) = delete;

  void ready() noexcept;
  void failed() noexcept;

  Tally wait();

  std::size_t expected() const noexcept { return expected_; }

private:
  void report_(bool ok) noexcept;

  const std::size_t expected_;

  std::mutex mtx_;
  std::condition_variable cv_;
  Tally tally_{};
};

} // namespace workpool::core
