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

#include "dispatch/config.hpp"
#include "dispatch/lifecycle.hpp"
#include "dispatch/pool.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace workpool::dispatch {

// Immutable pool template. Every pool it stamps gets its own channel and
// threads; the only thing they share is the lifecycle (and the fanout pool,
// when one was passed in through Cfg::fanout).
template <class State, class Payload>
class Blueprint {
public:
  using PoolT = Pool<State, Payload>;
  using CreateResult = typename PoolT::CreateResult;

  Blueprint(Cfg cfg, LifecyclePtr<State, Payload> lifecycle)
      : cfg_(std::move(cfg)), lifecycle_(std::move(lifecycle)) {
    if (!lifecycle_) throw std::invalid_argument("Blueprint: lifecycle is null");
  }

  CreateResult pool() const { return PoolT::create(cfg_, lifecycle_); }

  CreateResult pool_with_workers(std::size_t workers) const {
    Cfg cfg = cfg_;
    cfg.workers = workers;
    return PoolT::create(std::move(cfg), lifecycle_);
  }

  // Same setup and teardown, different process stage.
  template <class Process>
  CreateResult with_process(Process process) const {
    LifecyclePtr<State, Payload> lc =
        std::make_shared<const detail::ProcessOverride<State, Payload, Process>>(lifecycle_, std::move(process));
    return PoolT::create(cfg_, std::move(lc));
  }

  const Cfg& cfg() const noexcept { return cfg_; }
  const LifecyclePtr<State, Payload>& lifecycle() const noexcept { return lifecycle_; }

private:
  Cfg cfg_;
  LifecyclePtr<State, Payload> lifecycle_;
};

template <class Payload, class Setup, class Process, class Teardown>
auto make_blueprint(Cfg cfg, Setup setup, Process process, Teardown teardown) {
  auto lc = make_lifecycle<Payload>(std::move(setup), std::move(process), std::move(teardown));
  using State = typename std::remove_const_t<typename decltype(lc)::element_type>::state_type;
  return Blueprint<State, Payload>(std::move(cfg), std::move(lc));
}

} // namespace workpool::dispatch
