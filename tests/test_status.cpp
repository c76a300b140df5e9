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

#include "core/status.hpp"
#include "dispatch/errors.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

using workpool::core::Result;
using workpool::core::Status;
using workpool::dispatch::StartupError;
using workpool::dispatch::WorkerFault;

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

static void test_status_basics() {
  check("status_default_ok", Status{}.ok);
  check("status_ok_bool", static_cast<bool>(Status::Ok()));

  auto st = Status::Failf("bad value {} for {}", 7, "x");
  check("status_fail_not_ok", !st.ok);
  check("status_failf_msg", st.msg == "bad value 7 for x");
}

static void test_result_value() {
  auto r = Result<std::string>::Ok("hello");
  check("result_ok", static_cast<bool>(r));
  check("result_has_value", r.has_value);
  check("result_value", r.value == "hello");
  check("result_arrow", r->size() == 5);

  auto moved = std::move(r);
  check("result_moved_value", moved.has_value && *moved == "hello");
  check("result_moved_from_empty", !r.has_value);
}

static void test_result_failure() {
  Result<int> def;
  check("result_default_is_failure", !def && !def.has_value);

  auto r = Result<int>::Failf("{} requires value", "--jobs");
  check("result_fail", !r);
  check("result_fail_msg", r.st.msg == "--jobs requires value");
}

static void test_startup_error() {
  StartupError e(4, 3);
  check("startup_error_not_ok", !e.ok);
  check("startup_error_counts", e.expected == 4 && e.started == 3);
  check("startup_error_msg", e.msg == "couldn't start all workers. expected 4 but started 3");

  auto r = Result<int, StartupError>::Fail(StartupError(2, 0));
  check("typed_result_fail", !r && r.st.expected == 2 && r.st.started == 0);

  auto ok = Result<int, StartupError>::Ok(5);
  check("typed_result_ok", static_cast<bool>(ok) && *ok == 5);
}

static void test_worker_fault() {
  std::exception_ptr ep;
  try { throw std::runtime_error("connection reset"); } catch (...) { ep = std::current_exception(); }

  WorkerFault wf(2, 3, ep);
  check("worker_fault_worker", wf.worker() == 2);
  check("worker_fault_count", wf.faulted() == 3);
  check("worker_fault_what", std::string_view(wf.what()) == "3 worker(s) faulted, first was worker-2: connection reset");

  bool rethrown = false;
  try {
    wf.rethrow_cause();
  } catch (const std::runtime_error& e) {
    rethrown = std::string_view(e.what()) == "connection reset";
  }
  check("worker_fault_rethrow_cause", rethrown);
}

static void test_describe() {
  std::exception_ptr ep;
  try { throw 42; } catch (...) { ep = std::current_exception(); }
  check("describe_non_std", workpool::dispatch::describe(ep) == "unknown exception");
  check("describe_null", workpool::dispatch::describe(nullptr) == "no exception");
}

int main() {
  test_status_basics();
  test_result_value();
  test_result_failure();
  test_startup_error();
  test_worker_fault();
  test_describe();

  std::fprintf(stdout, "status: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
