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

#include "core/startup_latch.hpp"

namespace workpool::core {

void StartupLatch::ready() noexcept { report_(true); }

void StartupLatch::failed() noexcept { report_(false); }

void StartupLatch::report_(bool ok) noexcept {
  bool last = false;
  {
    std::lock_guard lk(mtx_);
    if (ok) ++tally_.ready;
    else ++tally_.failed;
    last = tally_.ready + tally_.failed >= expected_;
  }
  if (last) cv_.notify_all();
}

StartupLatch::Tally StartupLatch::wait() {
  std::unique_lock lk(mtx_);
  cv_.wait(lk, [&] { return tally_.ready + tally_.failed >= expected_; });
  return tally_;
}

} // namespace workpool::core
