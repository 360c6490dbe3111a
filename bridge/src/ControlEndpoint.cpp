// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <ControlEndpoint.hpp>
#include <Log.hpp>
#include <fwd.hpp>

#include <fmt/format.h>

Status ControlEndpoint::transfer(Command cmd, Direction dir,
                                 std::uint16_t value, std::uint16_t index,
                                 std::span<std::uint8_t> buffer,
                                 std::size_t length,
                                 std::chrono::milliseconds timeout) {
  if (length > Usb::MAX_CONTROL_PAYLOAD) {
    return Status::Error(
        Err::CONFIGURATION,
        fmt::format("control transfer of {} bytes exceeds the {} byte maximum",
                    length, Usb::MAX_CONTROL_PAYLOAD),
        static_cast<std::int64_t>(length));
  }
  if (length > buffer.size()) {
    return Status::Error(
        Err::CONFIGURATION,
        fmt::format("control transfer of {} bytes into a {} byte buffer",
                    length, buffer.size()),
        static_cast<std::int64_t>(length));
  }

  const IUsbDevice::Setup setup{to_underlying(cmd), dir, value, index};
  std::lock_guard lock{m_control_mutex};
  Log::debug("control {} {} value=0x{:04x} index=0x{:04x} len={}",
             command_to_string(cmd), dir == Direction::IN ? "IN" : "OUT",
             value, index, length);
  const auto res =
      m_dev->control_transfer(setup, buffer.first(length), timeout);
  if (res != IUsbDevice::TransferStatus::OK) {
    return Status::Error(Err::COMMUNICATION,
                         fmt::format("control transfer {} failed: {}",
                                     command_to_string(cmd),
                                     transfer_status_str(res)),
                         static_cast<std::int64_t>(res));
  }
  return Status::Ok();
}

auto ControlEndpoint::bulk_read(BulkEndpoint ep, std::size_t max_length,
                                std::chrono::milliseconds timeout)
    -> Result<std::optional<std::vector<std::uint8_t>>> {
  std::vector<std::uint8_t> buf(max_length);
  std::size_t transferred = 0;
  std::lock_guard lock{m_bulk_mutex};
  const auto res = m_dev->bulk_read(ep, buf, transferred, timeout);
  if (res == IUsbDevice::TransferStatus::TIMEOUT) {
    return std::optional<std::vector<std::uint8_t>>{};
  }
  if (res != IUsbDevice::TransferStatus::OK) {
    return Status::Error(
        Err::COMMUNICATION,
        fmt::format("bulk read on endpoint 0x{:02x} failed: {}",
                    to_underlying(ep), transfer_status_str(res)),
        static_cast<std::int64_t>(res));
  }
  buf.resize(transferred);
  return std::make_optional(std::move(buf));
}
