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

#include <memory>
#include <type_traits>
#include <utility>

namespace workpool::dispatch {

// The three stages every worker runs. One instance is shared, immutable, by
// all workers of all pools stamped from it, so implementations must be safe to
// call from several threads at once. Per-worker mutation belongs in State.
//
//   setup()            once per worker, on the worker thread; result is private
//   process(state, p)  once per job the worker dequeues
//   teardown(state)    once, when the worker receives the termination sentinel
//
// An exception escaping any stage ends that worker permanently.
template <class State, class Payload>
class Lifecycle {
public:
  using state_type = State;
  using payload_type = Payload;

  virtual ~Lifecycle() = default;

  virtual State setup() const = 0;
  virtual void process(State& state, Payload job) const = 0;
  virtual void teardown(State& state) const = 0;
};

template <class State, class Payload>
using LifecyclePtr = std::shared_ptr<const Lifecycle<State, Payload>>;

namespace detail {

template <class State, class Payload, class Setup, class Process, class Teardown>
class FnLifecycle final : public Lifecycle<State, Payload> {
public:
  FnLifecycle(Setup s, Process p, Teardown t)
      : setup_(std::move(s)), process_(std::move(p)), teardown_(std::move(t)) {}

  State setup() const override { return setup_(); }
  void process(State& state, Payload job) const override { process_(state, std::move(job)); }
  void teardown(State& state) const override { teardown_(state); }

private:
  Setup setup_;
  Process process_;
  Teardown teardown_;
};

// Borrows setup/teardown from a base lifecycle and replaces process.
template <class State, class Payload, class Process>
class ProcessOverride final : public Lifecycle<State, Payload> {
public:
  ProcessOverride(LifecyclePtr<State, Payload> base, Process p)
      : base_(std::move(base)), process_(std::move(p)) {}

  State setup() const override { return base_->setup(); }
  void process(State& state, Payload job) const override { process_(state, std::move(job)); }
  void teardown(State& state) const override { base_->teardown(state); }

private:
  LifecyclePtr<State, Payload> base_;
  Process process_;
};

} // namespace detail

// Adapts three callables to a Lifecycle. State is whatever setup() returns.
//
//   auto lc = make_lifecycle<std::string>(
//       [] { return Conn::open(); },
//       [](Conn& c, std::string q) { c.send(q); },
//       [](Conn& c) { c.close(); });
template <class Payload, class Setup, class Process, class Teardown>
auto make_lifecycle(Setup setup, Process process, Teardown teardown) {
  using State = std::decay_t<std::invoke_result_t<const Setup&>>;
  static_assert(std::is_move_constructible_v<State>, "setup() must return a movable state");
  static_assert(std::is_invocable_v<const Process&, State&, Payload>,
                "process must be callable as process(State&, Payload)");
  static_assert(std::is_invocable_v<const Teardown&, State&>,
                "teardown must be callable as teardown(State&)");

  return LifecyclePtr<State, Payload>(
      std::make_shared<const detail::FnLifecycle<State, Payload, Setup, Process, Teardown>>(
          std::move(setup), std::move(process), std::move(teardown)));
}

} // namespace workpool::dispatch
