// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Commands.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <span>
#include <vector>

// Non-volatile memory of the bridge, erased state is 0xFF
class FlashImage {
public:
  static constexpr std::size_t SIZE = Flash::ADDRESS_LIMIT;
  static constexpr std::uint8_t ERASED = 0xFF;

  FlashImage() : m_data(SIZE, ERASED) {}

  // false when the range leaves the device
  bool read(std::uint32_t address, std::span<std::uint8_t> out) const;
  bool write(std::uint32_t address, std::span<const std::uint8_t> data);
  bool erase(std::uint32_t address, std::size_t length);

  // Preloads a raw image from offset 0, returns the number of bytes loaded
  std::size_t load(std::istream &is);

  // simulates a worn out or locked flash
  void set_write_protected(bool val) noexcept;

private:
  bool in_range(std::uint32_t address, std::size_t length) const noexcept {
    return address <= SIZE && length <= SIZE - address;
  }

  mutable std::mutex m_mutex;
  std::vector<std::uint8_t> m_data;
  bool m_write_protected{false};
};
