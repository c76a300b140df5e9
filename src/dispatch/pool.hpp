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
#include "core/fanout_pool.hpp"
#include "core/startup_latch.hpp"
#include "core/status.hpp"
#include "dispatch/config.hpp"
#include "dispatch/errors.hpp"
#include "dispatch/job.hpp"
#include "dispatch/lifecycle.hpp"
#include "dispatch/worker.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace workpool::dispatch {

// Fixed set of workers fed from one job channel.
//
// create() blocks until every worker has finished setup() (or failed to), so a
// pool that exists has exactly cfg.workers threads waiting for jobs. Jobs go to
// whichever worker dequeues them first; each worker handles one job at a time.
//
// shutdown() sends one termination sentinel per worker recorded at
// construction and joins every thread. A worker that died from an exception is
// reported there, as WorkerFault. The destructor does the same but only logs.
template <class State, class Payload>
class Pool {
public:
  using Job = JobUnit<Payload>;
  using Jobs = core::Channel<Job>;
  using WorkerT = Worker<State, Payload>;
  using CreateResult = core::Result<Pool, StartupError>;

  static CreateResult create(Cfg cfg, LifecyclePtr<State, Payload> lifecycle) {
    if (cfg.workers == 0) throw std::invalid_argument("Pool: worker count must be at least 1");
    if (!lifecycle) throw std::invalid_argument("Pool: lifecycle is null");

    const std::size_t count = cfg.workers;

    auto fanout = cfg.fanout;
    if (!fanout && cfg.iterator_pool) fanout = std::make_shared<core::FanoutPool>(count);

    auto jobs = std::make_shared<Jobs>(cfg.queue_capacity);
    auto latch = std::make_shared<core::StartupLatch>(count);

    std::vector<std::unique_ptr<WorkerT>> workers;
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      try {
        workers.push_back(std::make_unique<WorkerT>(i, jobs, lifecycle, latch));
      } catch (const std::exception& e) {
        spdlog::error("Pool: cannot spawn worker-{}: {}", i, e.what());
        for (std::size_t j = i; j < count; ++j) latch->failed();
        break;
      }
    }

    const auto tally = latch->wait();
    Pool pool(std::move(cfg), std::move(lifecycle), std::move(jobs), std::move(workers), std::move(fanout));

    if (tally.ready == count) {
      spdlog::debug("Pool: {} worker(s) ready", count);
      return CreateResult::Ok(std::move(pool));
    }

    StartupError err(count, tally.ready);
    spdlog::error("Pool: {}", err.msg);

    // Survivors are told to terminate and are joined; their faults are not the caller's to handle.
    for (const auto& f : pool.stop_()) spdlog::debug("Pool: worker-{} fault during startup: {}", f.worker, describe(f.error));
    return CreateResult::Fail(std::move(err));
  }

  static CreateResult create_default(LifecyclePtr<State, Payload> lifecycle,
                                     bool iterator_pool = false,
                                     std::optional<std::size_t> queue_capacity = std::nullopt) {
    Cfg cfg;
    cfg.workers = default_worker_count();
    cfg.iterator_pool = iterator_pool;
    cfg.queue_capacity = queue_capacity;
    return create(std::move(cfg), std::move(lifecycle));
  }

  ~Pool() {
    for (const auto& f : stop_()) spdlog::error("Pool: worker-{} faulted: {}", f.worker, describe(f.error));
  }

  Pool(Pool&&) noexcept = default;
  Pool& operator=(Pool&&) = delete;

  Pool(const Pool&) = delete;
  Pool& operator=(const Pool&) = delete;

  // Queues one job. Blocks while a bounded channel is full.
  void execute(Payload job) {
    if (!jobs_ || stopped_) throw std::logic_error("Pool: execute on a pool that has been shut down");

    switch (jobs_->send(Job::task(std::move(job)))) {
      case Jobs::SendResult::Ok:
        return;
      case Jobs::SendResult::Closed:
        throw std::logic_error("Pool: execute on a closed job channel");
      case Jobs::SendResult::NoReceivers:
        throw std::runtime_error("Pool: every worker has exited, nobody can receive jobs");
    }
  }

  // Queues every item. With a fanout pool the items are pushed from its threads
  // in parallel; without one they are pushed in order from the caller's thread.
  void execute_iter(std::vector<Payload> items) {
    if (!fanout_) {
      for (auto& it : items) execute(std::move(it));
      return;
    }

    auto st = fanout_->for_each_range(items.size(), [&](std::size_t begin, std::size_t end) -> core::Status {
      for (std::size_t i = begin; i < end; ++i) execute(std::move(items[i]));
      return core::Status::Ok();
    });
    if (!st.ok) throw std::runtime_error(fmt::format("Pool: bulk submission failed: {}", st.msg));
  }

  // execute_iter() followed by shutdown(): returns once every item has been
  // processed and every worker has exited. The pool is shut down even when
  // submission fails; worker faults then win over the submission error and
  // surface as WorkerFault.
  void execute_and_finish_iter(std::vector<Payload> items) {
    try {
      execute_iter(std::move(items));
    } catch (const std::exception& e) {
      spdlog::debug("Pool: bulk submission stopped early: {}", e.what());
      shutdown();
      throw;
    }
    shutdown();
  }

  // A new pool with the same lifecycle and configuration, built from scratch.
  CreateResult clone_pool() const {
    if (!lifecycle_) throw std::logic_error("Pool: clone of a moved-from pool");
    return create(cfg_, lifecycle_);
  }

  // Terminates and joins every worker. Throws WorkerFault if any of them died
  // from an exception. Calling it again does nothing.
  void shutdown() {
    auto faults = stop_();
    if (faults.empty()) return;

    for (const auto& f : faults) spdlog::error("Pool: worker-{} faulted: {}", f.worker, describe(f.error));
    throw WorkerFault(faults.front().worker, faults.size(), faults.front().error);
  }

  std::size_t workers() const noexcept { return cfg_.workers; }
  std::optional<std::size_t> queue_capacity() const noexcept { return jobs_ ? jobs_->capacity() : std::nullopt; }
  bool has_iterator_pool() const noexcept { return static_cast<bool>(fanout_); }
  bool is_shut_down() const noexcept { return stopped_ || !jobs_; }
  std::size_t pending() const { return jobs_ ? jobs_->size() : 0; }

private:
  Pool(Cfg cfg,
       LifecyclePtr<State, Payload> lifecycle,
       std::shared_ptr<Jobs> jobs,
       std::vector<std::unique_ptr<WorkerT>> workers,
       std::shared_ptr<core::FanoutPool> fanout)
      : cfg_(std::move(cfg))
      , lifecycle_(std::move(lifecycle))
      , jobs_(std::move(jobs))
      , workers_(std::move(workers))
      , fanout_(std::move(fanout)) {}

  std::vector<Fault> stop_() {
    if (!jobs_ || stopped_) return {};
    stopped_ = true;

    // One sentinel per worker recorded at construction, alive or not. Once no
    // receiver is left the rest would only be dropped with the channel.
    std::size_t sent = 0;
    for (; sent < cfg_.workers; ++sent) {
      if (jobs_->send(Job::terminate()) != Jobs::SendResult::Ok) break;
    }
    if (sent < cfg_.workers)
      spdlog::warn("Pool: {} of {} termination sentinel(s) discarded, no worker left to receive them",
                    cfg_.workers - sent, cfg_.workers);

    std::vector<Fault> faults;
    for (auto& w : workers_) {
      if (auto ep = w->join()) faults.push_back(Fault{w->id(), std::move(ep)});
    }

    jobs_->close();
    return faults;
  }

  Cfg cfg_;
  LifecyclePtr<State, Payload> lifecycle_;
  std::shared_ptr<Jobs> jobs_;
  std::vector<std::unique_ptr<WorkerT>> workers_;
  std::shared_ptr<core::FanoutPool> fanout_;
  bool stopped_ = false;
};

template <class State, class Payload>
using PoolResult = typename Pool<State, Payload>::CreateResult;

// Callable form of Pool::create(). State is deduced from setup().
//
//   auto pr = make_pool<int>(4,
//       [] { return std::vector<int>{}; },
//       [](std::vector<int>& acc, int v) { acc.push_back(v); },
//       [](std::vector<int>&) {});
template <class Payload, class Setup, class Process, class Teardown>
auto make_pool(std::size_t count,
               Setup setup,
               Process process,
               Teardown teardown,
               bool iterator_pool = false,
               std::optional<std::size_t> queue_capacity = std::nullopt) {
  auto lc = make_lifecycle<Payload>(std::move(setup), std::move(process), std::move(teardown));
  using State = typename std::remove_const_t<typename decltype(lc)::element_type>::state_type;

  Cfg cfg;
  cfg.workers = count;
  cfg.iterator_pool = iterator_pool;
  cfg.queue_capacity = queue_capacity;
  return Pool<State, Payload>::create(std::move(cfg), std::move(lc));
}

} // namespace workpool::dispatch
