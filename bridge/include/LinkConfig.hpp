// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IUsbDevice.hpp>
#include <Timeouts.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

struct LinkConfig {
  UsbId usb_id{};
  unsigned connect_attempts = 3;
  std::chrono::milliseconds reconnect_wait{2000};
  std::chrono::milliseconds stream_poll{Timeouts::STREAM_POLL};
  std::uint32_t i2c_bit_rate = 100'000;
  std::uint32_t i2c_retry_count = 2;
};

// Board state of one connection, owned by the Connection and handed to the
// operations that depend on it
struct LinkContext {
  std::string firmware_revision;
  std::uint32_t boot_timestamp{};
  std::uint32_t i2c_bit_rate{};
  std::uint32_t i2c_retry_count{};
  // set while a buffered stream holds the bus
  std::atomic<bool> stream_active{false};
};
