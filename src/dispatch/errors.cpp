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

#include "dispatch/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace workpool::dispatch {

StartupError::StartupError(std::size_t expected_, std::size_t started_)
    : core::Status(false, fmt::format("couldn't start all workers. expected {} but started {}", expected_, started_))
    , expected(expected_)
    , started(started_) {}

WorkerFault::WorkerFault(std::size_t worker, std::size_t faulted, std::exception_ptr cause)
    : std::runtime_error(fmt::format("{} worker(s) faulted, first was worker-{}: {}", faulted, worker, describe(cause)))
    , worker_(worker)
    , faulted_(faulted)
    , cause_(std::move(cause)) {}

std::string describe(const std::exception_ptr& ep) {
  if (!ep) return "no exception";
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace workpool::dispatch
