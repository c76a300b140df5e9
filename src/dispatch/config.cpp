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

#include "dispatch/config.hpp"

#include <algorithm>
#include <thread>

namespace workpool::dispatch {

std::size_t default_worker_count() noexcept {
  const std::size_t cpus = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  return cpus * 2;
}

} // namespace workpool::dispatch
