// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <FlashAccess.hpp>
#include <Log.hpp>
#include <Timeouts.hpp>

#include <algorithm>
#include <array>

#include <fmt/format.h>

auto FlashAccess::read_flash(std::uint32_t address, std::size_t length)
    -> Result<std::vector<std::uint8_t>> {
  if (address > Flash::ADDRESS_LIMIT) {
    return Status::Error(
        Err::CONFIGURATION,
        fmt::format("flash address 0x{:05x} out of range, max allowed 0x{:05x}",
                    address, Flash::ADDRESS_LIMIT),
        address);
  }
  if (length > Flash::MAX_TRANSFER) {
    return Status::Error(
        Err::CONFIGURATION,
        fmt::format("flash read length of {} bytes exceeds per-transfer "
                    "maximum of {} bytes",
                    length, Flash::MAX_TRANSFER),
        static_cast<std::int64_t>(length));
  }

  std::vector<std::uint8_t> buf(length);
  const auto value = static_cast<std::uint16_t>(address & 0xFFFF);
  const auto index = static_cast<std::uint16_t>((address >> 16) & 0xFFFF);
  if (auto st = m_ep.transfer(Command::READ_FLASH, ControlEndpoint::Direction::IN,
                              value, index, buf, length, Timeouts::FLASH_READ);
      !st) {
    return st;
  }
  return buf;
}

auto FlashAccess::read_flash_region(std::uint32_t address, std::size_t length)
    -> Result<std::vector<std::uint8_t>> {
  std::vector<std::uint8_t> res;
  res.reserve(length);
  while (res.size() < length) {
    const auto chunk = std::min(Flash::MAX_TRANSFER, length - res.size());
    auto data = read_flash(address, chunk);
    if (!data) {
      return data.status();
    }
    if (data->empty()) {
      return Status::Error(
          Err::COMMUNICATION,
          fmt::format("empty flash read at 0x{:05x}", address), address);
    }
    res.insert(res.end(), data->begin(), data->end());
    address += static_cast<std::uint32_t>(data->size());
  }
  Log::debug("read {} flash bytes", res.size());
  return res;
}

Status FlashAccess::clear_log() {
  std::array<std::uint8_t, 4> dummy{};
  return m_ep.transfer(Command::CLEAR_FLASH_LOG, ControlEndpoint::Direction::OUT,
                       dummy, Timeouts::FLASH_CLEAR);
}
