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

#include "core/fanout_pool.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace workpool::dispatch {

struct Cfg {
  std::size_t workers = 1;

  // Provision a private FanoutPool of `workers` threads for execute_iter().
  bool iterator_pool = false;

  // Bounded job channel; submitters block once this many jobs are queued.
  // nullopt means unbounded. 0 is treated as 1.
  std::optional<std::size_t> queue_capacity{};

  // Shared FanoutPool for execute_iter(). Takes precedence over iterator_pool.
  std::shared_ptr<core::FanoutPool> fanout{};
};

// Twice the number of logical processors, at least 2 when that is unknown.
std::size_t default_worker_count() noexcept;

} // namespace workpool::dispatch
