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

#include "app/run.hpp"

#include "dispatch/config.hpp"
#include "dispatch/pool.hpp"
#include "platform/platform_all.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace workpool::app {

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ull;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ull;

std::uint64_t fnv1a(std::string_view s, std::uint64_t h = kFnvOffset) noexcept {
  for (unsigned char c : s) {
    h ^= c;
    h *= kFnvPrime;
  }
  return h;
}

// Per-worker private state. Stands in for the connection a real load
// generator would open in setup and close in teardown.
struct Sink {
  std::uint64_t jobs = 0;
  std::uint64_t bytes = 0;
  std::uint64_t digest = 0;
};

struct Totals {
  std::atomic_uint64_t jobs{0};
  std::atomic_uint64_t bytes{0};
  std::atomic_uint64_t digest{0}; // xor of worker digests, independent of scheduling
  std::atomic_uint64_t sinks{0};
};

std::string make_payload(std::size_t index, std::size_t size) {
  std::string out(size, '\0');
  for (std::size_t k = 0; k < size; ++k) out[k] = static_cast<char>('a' + (index + k) % 26);
  return out;
}

} // namespace

RunResult run(const Options& opt) {
  // Before any pool thread exists, so every thread inherits the blocked mask.
  workpool::platform::StopSignals signals;

  auto totals = std::make_shared<Totals>();

  auto lc = workpool::dispatch::make_lifecycle<std::string>(
      [] { return Sink{}; },
      [](Sink& s, std::string payload) {
        s.digest ^= fnv1a(payload);
        s.bytes += payload.size();
        ++s.jobs;
      },
      [totals](Sink& s) {
        totals->jobs.fetch_add(s.jobs, std::memory_order_relaxed);
        totals->bytes.fetch_add(s.bytes, std::memory_order_relaxed);
        totals->digest.fetch_xor(s.digest, std::memory_order_relaxed);
        totals->sinks.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("sink closed: {} job(s), {} byte(s)", s.jobs, s.bytes);
      });

  workpool::dispatch::Cfg cfg;
  cfg.workers = opt.workers ? opt.workers : workpool::dispatch::default_worker_count();
  cfg.iterator_pool = opt.iterator_pool;
  cfg.queue_capacity = opt.queue_capacity;

  spdlog::info("Starting {} worker(s), queue {}, {} job(s) of {} byte(s), {} submission",
               cfg.workers,
               cfg.queue_capacity ? std::to_string(*cfg.queue_capacity) : std::string("unbounded"),
               opt.jobs, opt.payload_bytes, opt.bulk ? "bulk" : "single");

  auto pr = workpool::dispatch::Pool<Sink, std::string>::create(cfg, lc);
  if (!pr) {
    spdlog::error("Pool startup failed: {}", pr.st.msg);
    return RunResult::kStartupFail;
  }
  auto& pool = *pr;

  const auto t0 = std::chrono::steady_clock::now();
  std::size_t submitted = 0;

  try {
    if (opt.bulk) {
      std::vector<std::string> items;
      items.reserve(opt.jobs);
      for (std::size_t i = 0; i < opt.jobs && !signals.stop_requested(); ++i)
        items.push_back(make_payload(i, opt.payload_bytes));
      submitted = items.size();
      pool.execute_and_finish_iter(std::move(items));
    } else {
      const std::size_t step = opt.jobs >= 10 ? opt.jobs / 10 : 0;
      try {
        for (; submitted < opt.jobs && !signals.stop_requested(); ++submitted) {
          pool.execute(make_payload(submitted, opt.payload_bytes));
          if (step && (submitted + 1) % step == 0)
            spdlog::info("Submitted {}/{} ({} queued)", submitted + 1, opt.jobs, pool.pending());
        }
      } catch (const std::runtime_error& e) {
        // Every worker is gone; shutdown() below reports why.
        spdlog::error("Submission stopped after {} job(s): {}", submitted, e.what());
      }
      pool.shutdown();
    }
  } catch (const workpool::dispatch::WorkerFault& e) {
    spdlog::error("Load run ended with faulted workers: {}", e.what());
    return RunResult::kWorkerFault;
  }

  const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  const auto done = totals->jobs.load();

  if (submitted < opt.jobs) spdlog::warn("Interrupted after {} of {} job(s)", submitted, opt.jobs);
  spdlog::info("Processed {} job(s), {} byte(s) in {:.3f}s ({:.0f} jobs/s) across {} worker(s)",
               done, totals->bytes.load(), secs, secs > 0 ? static_cast<double>(done) / secs : 0.0,
               totals->sinks.load());
  spdlog::info("Payload digest: {:016x}", totals->digest.load());

  if (done != submitted) {
    spdlog::error("Processed {} job(s) but submitted {}", done, submitted);
    return RunResult::kWorkerFault;
  }
  return RunResult::Success;
}

} // namespace workpool::app
