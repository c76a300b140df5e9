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

#include <spdlog/spdlog.h>

#include <charconv>
#include <string_view>
#include <system_error>

namespace workpool::app {

using workpool::core::Result;

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                  std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return Result<std::string_view>::Fail(std::string(opt) + " requires value");
  return Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

static Result<std::size_t> read_size_value(int& i, int argc, char** argv,
                                           std::string_view a, std::string_view opt, std::size_t min) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return Result<std::size_t>::Fail(std::move(vr.st.msg));

  const std::string_view s = vr.value;
  std::size_t v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    return Result<std::size_t>::Failf("{} expects a non-negative integer, got '{}'", opt, s);
  if (v < min) return Result<std::size_t>::Failf("{} must be at least {}", opt, min);
  return Result<std::size_t>::Ok(v);
}

std::string usage_text() {
  std::string out;
  out.reserve(1024);

  out += "workpool-bench v";
  out += WORKPOOL_VERSION;
  out += "\n\n";

  out += R"(Usage:
  workpool-bench [--workers N] [--jobs N] [--payload-bytes N] [--queue N] [--iter-pool] [--bulk]

Options:
  --help, -h
  --version
  --workers <N>, -w <N>        worker threads (default: 2 x logical processors)
  --jobs <N>, -n <N>           number of jobs to submit (default: 100000)
  --payload-bytes <N>          bytes per job payload (default: 64)
  --queue <N>                  bound the job queue to N entries; submission blocks when full
  --iter-pool                  give the pool its own submission threads for --bulk
  --bulk                       submit all jobs in one bulk call instead of one by one
  --verbose, -v                enable verbose logging

SIGINT/SIGTERM stop submission; queued jobs are still processed before exit.
)";
  return out;
}

Result<Options> parse_cli(int argc, char** argv) noexcept {
  Options o;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }

    if (a == "--verbose" || a == "-v") {
      o.verbose = true;
      spdlog::set_level(spdlog::level::debug);
      continue;
    }

    if (a == "--iter-pool") { o.iterator_pool = true; continue; }
    if (a == "--bulk") { o.bulk = true; continue; }

    if (a == "-w" || is_opt(a, "--workers") || is_opt(a, "-w")) {
      auto vr = read_size_value(i, argc, argv, a, a.starts_with("--") ? "--workers" : "-w", 1);
      if (!vr) return Result<Options>::Fail(std::move(vr.st.msg));
      o.workers = vr.value;
      continue;
    }

    if (a == "-n" || is_opt(a, "--jobs") || is_opt(a, "-n")) {
      auto vr = read_size_value(i, argc, argv, a, a.starts_with("--") ? "--jobs" : "-n", 0);
      if (!vr) return Result<Options>::Fail(std::move(vr.st.msg));
      o.jobs = vr.value;
      continue;
    }

    if (is_opt(a, "--payload-bytes")) {
      auto vr = read_size_value(i, argc, argv, a, "--payload-bytes", 0);
      if (!vr) return Result<Options>::Fail(std::move(vr.st.msg));
      o.payload_bytes = vr.value;
      continue;
    }

    if (is_opt(a, "--queue")) {
      auto vr = read_size_value(i, argc, argv, a, "--queue", 1);
      if (!vr) return Result<Options>::Fail(std::move(vr.st.msg));
      o.queue_capacity = vr.value;
      continue;
    }

    if (a.starts_with("-")) {
      return Result<Options>::Fail("Unknown option: " + std::string(a));
    }

    return Result<Options>::Fail("Positional arguments are not supported: " + std::string(a));
  }

  if (o.iterator_pool && !o.bulk) return Result<Options>::Fail("--iter-pool only affects --bulk submission");

  return Result<Options>::Ok(std::move(o));
}

} // namespace workpool::app
