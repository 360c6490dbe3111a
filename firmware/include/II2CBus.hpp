// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BusTransaction.hpp>

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>

// Transaction status as reported to the host, 0 is success
enum class BusStatus : std::uint32_t {
  OK = 0,
  BAD_ARGUMENT = 1,
  TIMEOUT = 2,
  NACK = 3,
  ARBITRATION_LOST = 4,
  INIT_FAILED = 5,
  BUSY = 6,
};

constexpr std::string_view bus_status_str(BusStatus st) noexcept {
  switch (st) {
  case BusStatus::OK:
    return "OK";
  case BusStatus::BAD_ARGUMENT:
    return "BAD_ARGUMENT";
  case BusStatus::TIMEOUT:
    return "TIMEOUT";
  case BusStatus::NACK:
    return "NACK";
  case BusStatus::ARBITRATION_LOST:
    return "ARBITRATION_LOST";
  case BusStatus::INIT_FAILED:
    return "INIT_FAILED";
  case BusStatus::BUSY:
    return "BUSY";
  }
  return "UNKNOWN";
}

// Bus controller of the bridge. One call is one attempt, retrying is up to
// the caller.
struct II2CBus {
  virtual BusStatus init(std::uint32_t bit_rate) = 0;

  virtual BusStatus read(Preamble const &preamble, std::span<std::uint8_t> out,
                         std::chrono::milliseconds timeout) = 0;

  virtual BusStatus write(Preamble const &preamble,
                          std::span<const std::uint8_t> data,
                          std::chrono::milliseconds timeout) = 0;

  virtual ~II2CBus() = default;
};
