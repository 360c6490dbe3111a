// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <span>
#include <string_view>

struct UsbId {
  std::uint16_t vid = 0x0456;
  std::uint16_t pid = 0xEF02;
};

struct IUsbDevice {
  using Ptr = std::shared_ptr<IUsbDevice>;

  struct Interrupted : std::exception {
    const char *what() const noexcept override { return "USB Interrupted"; }
  };

  enum class Direction : std::uint8_t { OUT, IN };

  enum class BulkEndpoint : std::uint8_t { I2C_IN = 0x81, STREAM_IN = 0x82 };

  enum class OpenStatus { OK, NOT_FOUND, BUSY };

  enum class TransferStatus {
    OK,
    TIMEOUT,
    STALL,
    BUSY,
    DISCONNECTED,
    OVERFLOW,
    ERROR
  };

  // Vendor request setup stage
  struct Setup {
    std::uint8_t request{};
    Direction dir{Direction::OUT};
    std::uint16_t value{};
    std::uint16_t index{};
  };

  virtual OpenStatus open() = 0;
  virtual void reset() = 0;
  virtual void close() = 0;

  // A control transfer either moves all of data or fails, short transfers
  // are reported as ERROR
  virtual TransferStatus control_transfer(Setup const &setup,
                                          std::span<std::uint8_t> data,
                                          std::chrono::milliseconds timeout) = 0;

  // Reads one packet, transferred holds the received byte count on OK
  virtual TransferStatus bulk_read(BulkEndpoint ep,
                                   std::span<std::uint8_t> data,
                                   std::size_t &transferred,
                                   std::chrono::milliseconds timeout) = 0;

  static Ptr Create(UsbId id = {});

  virtual ~IUsbDevice() = default;
};

constexpr std::string_view
transfer_status_str(IUsbDevice::TransferStatus st) noexcept {
  using TS = IUsbDevice::TransferStatus;
  switch (st) {
  case TS::OK:
    return "OK";
  case TS::TIMEOUT:
    return "TIMEOUT";
  case TS::STALL:
    return "STALL";
  case TS::BUSY:
    return "BUSY";
  case TS::DISCONNECTED:
    return "DISCONNECTED";
  case TS::OVERFLOW:
    return "OVERFLOW";
  case TS::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}
