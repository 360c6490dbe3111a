// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Commands.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <string_view>

// Board state shared by the firmware components. Fields touched from the
// data-ready context are atomic.
struct DeviceState {
  using Revision = std::array<std::uint8_t, Usb::FIRMWARE_REV_SIZE>;

  explicit DeviceState(std::string_view rev) {
    std::copy_n(rev.begin(), std::min(rev.size(), revision.size()),
                revision.begin());
  }

  // NUL padded, not terminated when all bytes are used
  Revision revision{};
  std::atomic<std::uint32_t> boot_timestamp{0};
  std::atomic<std::uint32_t> i2c_bit_rate{I2C::MIN_BIT_RATE};
  std::atomic<std::uint32_t> i2c_retry_count{0};
  // status of the last bus transaction, read back by the host
  std::atomic<std::uint32_t> last_status{0};
};
