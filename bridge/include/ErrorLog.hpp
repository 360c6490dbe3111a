// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Commands.hpp>
#include <FlashAccess.hpp>
#include <Status.hpp>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <vector>

// One fault record as written by the bridge firmware
//
// Record layout (32 bytes, little endian):
//   [0, 4)   reserved
//   [4, 8)   line
//   [8, 12)  error code
//   [12, 16) boot timestamp (unix seconds)
//   [16, 20) file identifier
//   [20, 32) firmware revision, not necessarily NUL terminated
class ErrorLogEntry {
public:
  static std::optional<ErrorLogEntry>
  parse(std::span<const std::uint8_t> record);

  std::uint32_t line() const noexcept { return m_line; }
  std::uint32_t file_identifier() const noexcept { return m_file_identifier; }
  std::uint32_t error_code() const noexcept { return m_error_code; }
  std::uint32_t boot_timestamp() const noexcept { return m_boot_timestamp; }
  std::string const &firmware_revision() const noexcept {
    return m_firmware_revision;
  }

private:
  ErrorLogEntry() = default;

  std::uint32_t m_line{};
  std::uint32_t m_file_identifier{};
  std::uint32_t m_error_code{};
  std::uint32_t m_boot_timestamp{};
  std::string m_firmware_revision;
};

std::ostream &operator<<(std::ostream &os, ErrorLogEntry const &entry);

class ErrorLogStore {
public:
  explicit ErrorLogStore(FlashAccess &flash) : m_flash{flash} {}

  // Raw count as stored in flash, not clamped
  Result<std::uint32_t> count();

  // Oldest to newest as laid out in flash, at most Flash::LOG_CAPACITY
  // entries. Any undecodable record fails the whole read.
  Result<std::vector<ErrorLogEntry>> log();

  Status clear() { return m_flash.clear_log(); }

private:
  FlashAccess &m_flash;
};
