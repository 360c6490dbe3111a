// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Commands.hpp>
#include <IUsbDevice.hpp>
#include <Status.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

// Single request/response exchange on the control endpoint. At most one
// exchange is outstanding, failed exchanges are never retried here since
// a repeated write may duplicate a side effect on the bus.
class ControlEndpoint {
public:
  using Direction = IUsbDevice::Direction;
  using BulkEndpoint = IUsbDevice::BulkEndpoint;

  explicit ControlEndpoint(IUsbDevice::Ptr dev) : m_dev{std::move(dev)} {}

  Status transfer(Command cmd, Direction dir, std::uint16_t value,
                  std::uint16_t index, std::span<std::uint8_t> buffer,
                  std::size_t length, std::chrono::milliseconds timeout);

  Status transfer(Command cmd, Direction dir, std::span<std::uint8_t> buffer,
                  std::chrono::milliseconds timeout) {
    return transfer(cmd, dir, 0, 0, buffer, buffer.size(), timeout);
  }

  // Reads one bulk packet, an empty optional means no data arrived within
  // the timeout
  Result<std::optional<std::vector<std::uint8_t>>>
  bulk_read(BulkEndpoint ep, std::size_t max_length,
            std::chrono::milliseconds timeout);

  IUsbDevice &device() const noexcept { return *m_dev; }

private:
  IUsbDevice::Ptr m_dev;
  std::mutex m_control_mutex;
  std::mutex m_bulk_mutex;
};
