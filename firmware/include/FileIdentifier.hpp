// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string_view>

// Module that recorded a fault, stored in the error log records
enum class FileIdentifier : std::uint32_t {
  UNKNOWN = 0,
  FIRMWARE = 1,
  I2C_EXECUTOR = 2,
  STREAM_PRODUCER = 3,
};

constexpr std::string_view file_identifier_str(std::uint32_t id) noexcept {
  switch (static_cast<FileIdentifier>(id)) {
  case FileIdentifier::UNKNOWN:
    break;
  case FileIdentifier::FIRMWARE:
    return "Firmware.cpp";
  case FileIdentifier::I2C_EXECUTOR:
    return "I2CExecutor.cpp";
  case FileIdentifier::STREAM_PRODUCER:
    return "StreamProducer.cpp";
  }
  return "unknown";
}
