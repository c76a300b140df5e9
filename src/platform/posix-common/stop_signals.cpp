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


#include "platform/posix-common/stop_signals.hpp"

#include <pthread.h>

#include <cerrno>
#include <cstring>
#include <ctime>

#include <spdlog/spdlog.h>

namespace workpool::posix_common {

namespace {

// How long the watcher sleeps in sigtimedwait() before looking at its stop token.
constexpr long kPollNanos = 100'000'000;

sigset_t stop_set() {
  sigset_t set{};
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

} // namespace

StopSignals::StopSignals() {
  const sigset_t set = stop_set();
  if (const int rc = ::pthread_sigmask(SIG_BLOCK, &set, &prev_mask_); rc != 0) {
    spdlog::warn("Cannot block SIGINT/SIGTERM ({}), they will terminate the process", std::strerror(rc));
    return;
  }
  armed_ = true;
  watcher_ = std::jthread([this](std::stop_token st) { watch_(st); });
}

StopSignals::~StopSignals() {
  if (!armed_) return;
  if (watcher_.joinable()) {
    watcher_.request_stop();
    watcher_.join();
  }
  (void)::pthread_sigmask(SIG_SETMASK, &prev_mask_, nullptr);
}

void StopSignals::watch_(std::stop_token st) noexcept {
  const sigset_t set = stop_set();
  const timespec poll{0, kPollNanos};

  while (!st.stop_requested()) {
    siginfo_t info{};
    const int signo = ::sigtimedwait(&set, &info, &poll);
    if (signo < 0) {
      if (errno != EAGAIN && errno != EINTR) spdlog::debug("sigtimedwait failed: {}", std::strerror(errno));
      continue;
    }

    const int n = seen_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (n == 1) spdlog::warn("{} received, stopping", signo == SIGINT ? "SIGINT" : "SIGTERM");
    else spdlog::debug("{} received again (#{})", signo == SIGINT ? "SIGINT" : "SIGTERM", n);
    stop_.request_stop();
  }
}

} // namespace workpool::posix_common
