// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>

namespace Timeouts {
using namespace std::chrono_literals;
constexpr auto FLASH_READ = 5000ms;
constexpr auto FLASH_CLEAR = 2000ms;
constexpr auto COMMAND = 1000ms;
// bus timeout + margin is added on top of this for bus transactions
constexpr auto I2C_TRANSFER = 2000ms;
constexpr auto STREAM_POLL = 10ms;
} // namespace Timeouts
