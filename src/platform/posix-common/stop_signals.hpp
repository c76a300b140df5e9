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

#include <atomic>
#include <stop_token>
#include <thread>

#include <signal.h>

namespace workpool::posix_common {

// Turns SIGINT and SIGTERM into a stop request instead of process death.
//
// The constructor blocks both signals in the calling thread, so it has to run
// before any other thread is started; those threads inherit the mask and the
// signals are left for the watcher thread to collect. The destructor stops the
// watcher and restores the previous mask.
class StopSignals {
public:
  StopSignals();
  ~StopSignals();

  StopSignals(const StopSignals&) = delete;
  StopSignals& operator=(const StopSignals&) = delete;

  // False when the mask could not be changed; signals then keep their
  // default behaviour.
  bool armed() const noexcept { return armed_; }

  bool stop_requested() const noexcept { return stop_.stop_requested(); }
  std::stop_token token() const noexcept { return stop_.get_token(); }
  int signals_seen() const noexcept { return seen_.load(std::memory_order_relaxed); }

private:
  void watch_(std::stop_token st) noexcept;

  std::stop_source stop_{};
  std::atomic_int seen_{0};

  sigset_t prev_mask_{};
  bool armed_ = false;

  std::jthread watcher_{};
};

} // namespace workpool::posix_common
