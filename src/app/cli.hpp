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
#include <optional>
#include <string>

// Set from the project version by the build.
#ifndef WORKPOOL_VERSION
#define WORKPOOL_VERSION "0.1.0"
#endif

namespace workpool::app {

struct Options {
    bool help = false;
    bool version = false;
    bool verbose = false;

    std::size_t workers = 0; // 0: twice the logical processor count
    std::size_t jobs = 100'000;
    std::size_t payload_bytes = 64;
    std::optional<std::size_t> queue_capacity;

    bool iterator_pool = false; // give the pool its own fanout threads
    bool bulk = false;          // submit everything with one execute_iter()
};

workpool::core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace workpool::app
