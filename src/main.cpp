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

#include "app/cli.hpp"
#include "app/run.hpp"

#include <cstdlib>
#include <exception>

#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  try {
    auto opt = workpool::app::parse_cli(argc, argv);
    if (!opt) {
      spdlog::error("{}. Use --help to see usage.", opt.st.msg);
      return static_cast<int>(workpool::app::RunResult::kUsage);
    }

    if (opt->help) {
      spdlog::info("{}", workpool::app::usage_text());
      return EXIT_SUCCESS;
    }
    if (opt->version) {
      spdlog::info("workpool-bench v{}", WORKPOOL_VERSION);
      return EXIT_SUCCESS;
    }

    auto ret = workpool::app::run(*opt);
    return ret == workpool::app::RunResult::Success ? EXIT_SUCCESS : static_cast<int>(ret);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }
}
