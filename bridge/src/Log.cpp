// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Log.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::atomic<Verbosity> s_level{Verbosity::ERROR};
std::mutex s_write_mutex;

constexpr std::string_view prefix(Verbosity v) noexcept {
  switch (v) {
  case Verbosity::ERROR:
    return "ERROR:";
  case Verbosity::INFO:
    return "INFO:";
  case Verbosity::DEBUG:
    return "DEBUG:";
  }
  return "";
}
} // namespace

namespace Log {

void set_level(Verbosity v) noexcept { s_level = v; }

Verbosity level() noexcept { return s_level; }

void write(Verbosity v, std::string_view msg) {
  // data-ready threads of the mock device log concurrently
  std::lock_guard lock{s_write_mutex};
  std::cerr << prefix(v) << msg << '\n';
}

} // namespace Log
