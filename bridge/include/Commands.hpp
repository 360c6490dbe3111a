// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

// Vendor requests understood by the bridge firmware
enum class Command : std::uint8_t {
  GET_FIRMWARE_INFO = 0xB0,
  SET_BOOT_TIME = 0xB1,
  STREAM_START = 0xC0,
  STREAM_STOP = 0xC1,
  I2C_READ_BYTES = 0xD0,
  I2C_WRITE_BYTES = 0xD1,
  I2C_SET_BIT_RATE = 0xD2,
  I2C_SET_RETRY_COUNT = 0xD3,
  GET_TRANSACTION_STATUS = 0xD4,
  READ_FLASH = 0xF2,
  CLEAR_FLASH_LOG = 0xF3,
};

constexpr std::string_view command_to_string(Command cmd) noexcept {
  switch (cmd) {
  case Command::GET_FIRMWARE_INFO:
    return "GET_FIRMWARE_INFO";
  case Command::SET_BOOT_TIME:
    return "SET_BOOT_TIME";
  case Command::STREAM_START:
    return "STREAM_START";
  case Command::STREAM_STOP:
    return "STREAM_STOP";
  case Command::I2C_READ_BYTES:
    return "I2C_READ_BYTES";
  case Command::I2C_WRITE_BYTES:
    return "I2C_WRITE_BYTES";
  case Command::I2C_SET_BIT_RATE:
    return "I2C_SET_BIT_RATE";
  case Command::I2C_SET_RETRY_COUNT:
    return "I2C_SET_RETRY_COUNT";
  case Command::GET_TRANSACTION_STATUS:
    return "GET_TRANSACTION_STATUS";
  case Command::READ_FLASH:
    return "READ_FLASH";
  case Command::CLEAR_FLASH_LOG:
    return "CLEAR_FLASH_LOG";
  }
  return "UNKNOWN";
}

namespace Flash {
constexpr std::uint32_t ADDRESS_LIMIT = 0x4'0000;
constexpr std::size_t MAX_TRANSFER = 4096;

constexpr std::uint32_t LOG_COUNT_ADDR = 0x3'4000;
constexpr std::uint32_t LOG_BASE_ADDR = 0x3'4040;
constexpr std::uint32_t LOG_CAPACITY = 1500;
constexpr std::size_t LOG_RECORD_SIZE = 32;

static_assert(LOG_BASE_ADDR + LOG_CAPACITY * LOG_RECORD_SIZE <= ADDRESS_LIMIT,
              "error log does not fit into flash");
} // namespace Flash

namespace Usb {
// Control endpoint payload ceiling
constexpr std::size_t MAX_CONTROL_PAYLOAD = 4096;
constexpr std::size_t FIRMWARE_REV_SIZE = 12;
constexpr std::size_t FIRMWARE_INFO_SIZE = FIRMWARE_REV_SIZE + 4;
} // namespace Usb

namespace I2C {
constexpr std::uint32_t MIN_BIT_RATE = 100'000;
constexpr std::uint32_t MAX_BIT_RATE = 1'000'000;
// upper bound of the per transaction retries, the device clamps larger values
constexpr std::uint32_t MAX_RETRY_COUNT = 16;
} // namespace I2C
