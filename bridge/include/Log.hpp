// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <concepts>
#include <string_view>
#include <utility>

#include <fmt/format.h>

enum class Verbosity { ERROR = 0, INFO = 1, DEBUG = 2, MAX = DEBUG };

template <std::integral T> Verbosity verbosity(T val) {
  return static_cast<Verbosity>(
      std::clamp(val, T{0}, static_cast<T>(Verbosity::MAX)));
}

namespace Log {

void set_level(Verbosity v) noexcept;
Verbosity level() noexcept;
void write(Verbosity v, std::string_view msg);

inline bool enabled(Verbosity v) noexcept { return v <= level(); }

template <typename... Args>
void error(fmt::format_string<Args...> f, Args &&...args) {
  write(Verbosity::ERROR, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Verbosity::INFO)) {
    write(Verbosity::INFO, fmt::format(f, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void debug(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Verbosity::DEBUG)) {
    write(Verbosity::DEBUG, fmt::format(f, std::forward<Args>(args)...));
  }
}

} // namespace Log
