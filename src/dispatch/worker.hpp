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

#include "core/channel.hpp"
#include "core/startup_latch.hpp"
#include "dispatch/errors.hpp"
#include "dispatch/job.hpp"
#include "dispatch/lifecycle.hpp"
#include "platform/platform_all.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace workpool::dispatch {

// One background thread running setup -> (process)* -> teardown.
//
// The thread reports to the startup latch exactly once: ready after setup
// returned, failed if setup threw. Any exception escaping a stage ends the
// thread; it is kept in the fault slot and handed out by join().
template <class State, class Payload>
class Worker {
public:
  using Job = JobUnit<Payload>;
  using Jobs = core::Channel<Job>;

  Worker(std::size_t id,
         std::shared_ptr<Jobs> jobs,
         LifecyclePtr<State, Payload> lifecycle,
         std::shared_ptr<core::StartupLatch> latch)
      : id_(id) {
    // Attach the receiver here, not on the new thread, so the channel never
    // looks receiver-less between spawn and the first recv().
    typename Jobs::Receiver rx(std::move(jobs));
    thread_.emplace([this, rx = std::move(rx), lc = std::move(lifecycle), latch = std::move(latch)]() mutable {
      run_(std::move(rx), *lc, *latch);
    });
  }

  ~Worker() { (void)join(); }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  std::size_t id() const noexcept { return id_; }
  bool joined() const noexcept { return !thread_.has_value(); }

  // Waits for the thread and returns its fault, if any. Only the first call
  // joins; later calls return nothing.
  std::exception_ptr join() noexcept {
    if (!thread_) return {};
    std::thread t = std::move(*thread_);
    thread_.reset();
    if (t.joinable()) t.join();
    return std::exchange(fault_, nullptr);
  }

private:
  void run_(typename Jobs::Receiver rx, const Lifecycle<State, Payload>& lc, core::StartupLatch& latch) noexcept {
    platform::set_current_thread_name(fmt::format("worker-{}", id_));

    bool reported = false;
    try {
      State state = lc.setup();
      latch.ready();
      reported = true;
      spdlog::debug("worker-{}: ready", id_);

      for (;;) {
        auto job = rx.recv();
        if (!job) {
          spdlog::debug("worker-{}: job channel closed", id_);
          break;
        }
        if (job->is_terminate()) {
          lc.teardown(state);
          break;
        }
        lc.process(state, std::move(*job).payload());
      }
      spdlog::debug("worker-{}: exited", id_);
    } catch (...) {
      fault_ = std::current_exception();
      spdlog::debug("worker-{}: faulted {}: {}", id_, reported ? "while running" : "during setup", describe(fault_));
      if (!reported) latch.failed();
    }
  }

  const std::size_t id_;
  std::exception_ptr fault_{};
  std::optional<std::thread> thread_{};
};

} // namespace workpool::dispatch
