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

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace workpool::dispatch {

// Returned by pool construction when fewer workers than requested got past setup.
struct StartupError : core::Status {
  std::size_t expected = 0;
  std::size_t started = 0;

  StartupError() = default;
  StartupError(std::size_t expected_, std::size_t started_);
};

// A fault captured on a worker thread, reported when the pool shuts down.
struct Fault {
  std::size_t worker = 0;
  std::exception_ptr error;
};

// Thrown by Pool::shutdown() when at least one worker died from an exception.
class WorkerFault : public std::runtime_error {
public:
  WorkerFault(std::size_t worker, std::size_t faulted, std::exception_ptr cause);

  std::size_t worker() const noexcept { return worker_; }
  std::size_t faulted() const noexcept { return faulted_; }
  const std::exception_ptr& cause() const noexcept { return cause_; }

  [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause_); }

private:
  std::size_t worker_;
  std::size_t faulted_;
  std::exception_ptr cause_;
};

// what() of the captured exception, or a placeholder for non-std exceptions.
std::string describe(const std::exception_ptr& ep);

} // namespace workpool::dispatch
