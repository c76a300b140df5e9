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

#include <cstddef>
#include <utility>
#include <variant>

namespace workpool::dispatch {

// One message on a pool's job channel: either a payload for process() or the
// sentinel that makes the receiving worker run teardown() and exit.
template <class Payload>
class JobUnit {
public:
  struct Terminate { };

  static JobUnit task(Payload p) { return JobUnit(std::in_place_index<0>, std::move(p)); }
  static JobUnit terminate() { return JobUnit(std::in_place_index<1>, Terminate{}); }

  bool is_terminate() const noexcept { return v_.index() == 1; }

  Payload& payload() & { return std::get<0>(v_); }
  Payload&& payload() && { return std::get<0>(std::move(v_)); }

private:
  template <std::size_t I, class... Args>
  explicit JobUnit(std::in_place_index_t<I> tag, Args&&... args) : v_(tag, std::forward<Args>(args)...) {}

  std::variant<Payload, Terminate> v_;
};

} // namespace workpool::dispatch
