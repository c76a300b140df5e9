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

#if defined(WORKPOOL_PLATFORM_LINUX)
  #include "platform/posix-common/stop_signals.hpp"
  #include "platform/linux/thread_name.hpp"

namespace workpool::platform {
using namespace linux;
using namespace posix_common;
} // namespace workpool::platform

#else
  #error "Unsupported platform"
#endif
