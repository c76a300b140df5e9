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

#include "core/fanout_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <thread>
#include <vector>

using workpool::core::FanoutPool;
using workpool::core::Status;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool ok) {
  if (ok) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static void test_zero_threads_is_one() {
  FanoutPool pool(0);
  check("zero_threads_is_one", pool.threads() == 1);
}

static void test_range_after_stop() {
  FanoutPool pool(1);
  pool.stop();

  bool called = false;
  auto st = pool.for_each_range(3, [&](std::size_t, std::size_t) -> Status {
    called = true;
    return Status::Ok();
  });
  check("range_after_stop_fails", !st.ok && !called);
}

static void test_for_each_range_covers_once(std::size_t n, std::size_t threads) {
  FanoutPool pool(threads);
  std::vector<std::atomic<int>> hits(n);

  auto st = pool.for_each_range(n, [&](std::size_t begin, std::size_t end) -> Status {
    for (std::size_t i = begin; i < end; ++i) hits[i].fetch_add(1);
    return Status::Ok();
  });
  check("range_status_ok", st.ok);

  bool once = true;
  for (auto& h : hits) once = once && h.load() == 1;
  check("range_each_index_once", once);
}

static void test_for_each_range_parallel() {
  FanoutPool pool(4);
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};

  auto st = pool.for_each_range(4, [&](std::size_t, std::size_t) -> Status {
    const int now = in_flight.fetch_add(1) + 1;
    int p = peak.load();
    while (now > p && !peak.compare_exchange_weak(p, now)) {}
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    in_flight.fetch_sub(1);
    return Status::Ok();
  });
  check("parallel_ranges_ok", st.ok);
  check("parallel_ranges_overlap", peak.load() > 1);
}

static void test_for_each_range_failure() {
  FanoutPool pool(3);
  auto st = pool.for_each_range(30, [&](std::size_t begin, std::size_t) -> Status {
    if (begin == 0) throw std::runtime_error("range failed");
    return Status::Ok();
  });
  check("range_failure_reported", !st.ok && st.msg == "range failed");

  // A failed call leaves nothing behind for the next one.
  st = pool.for_each_range(30, [](std::size_t, std::size_t) { return Status::Ok(); });
  check("range_failure_not_sticky", st.ok);
}

static void test_for_each_range_empty() {
  FanoutPool pool(2);
  bool called = false;
  auto st = pool.for_each_range(0, [&](std::size_t, std::size_t) -> Status {
    called = true;
    return Status::Ok();
  });
  check("empty_range_ok", st.ok && !called);
}

static void test_shared_between_callers() {
  FanoutPool pool(2);
  std::atomic<int> total{0};

  auto body = [&](std::size_t begin, std::size_t end) -> Status {
    total.fetch_add(static_cast<int>(end - begin));
    return Status::Ok();
  };

  Status a, b;
  std::thread t1([&] { a = pool.for_each_range(500, body); });
  std::thread t2([&] { b = pool.for_each_range(700, body); });
  t1.join();
  t2.join();

  check("shared_callers_ok", a.ok && b.ok);
  check("shared_callers_total", total.load() == 1200);
}

static void test_failure_isolated_between_callers() {
  FanoutPool pool(2);

  Status bad, good;
  std::thread t1([&] {
    bad = pool.for_each_range(200, [](std::size_t, std::size_t) -> Status { return Status::Fail("only mine"); });
  });
  std::thread t2([&] {
    good = pool.for_each_range(200, [](std::size_t, std::size_t) { return Status::Ok(); });
  });
  t1.join();
  t2.join();

  check("isolated_failure_reported", !bad.ok && bad.msg == "only mine");
  check("isolated_other_caller_ok", good.ok);
}

int main() {
  test_zero_threads_is_one();
  test_range_after_stop();
  test_for_each_range_covers_once(1000, 4);
  test_for_each_range_covers_once(2, 8);
  test_for_each_range_covers_once(7, 3);
  test_for_each_range_parallel();
  test_for_each_range_failure();
  test_for_each_range_empty();
  test_shared_between_callers();
  test_failure_isolated_between_callers();

  std::fprintf(stdout, "fanout_pool: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
