// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Firmware.hpp>
#include <Log.hpp>
#include <fwd.hpp>
#include <utils.hpp>

#include <algorithm>
#include <optional>

using Direction = IUsbDevice::Direction;

namespace {
std::optional<Direction> command_direction(std::uint8_t request) {
  switch (static_cast<Command>(request)) {
  case Command::GET_FIRMWARE_INFO:
  case Command::GET_TRANSACTION_STATUS:
  case Command::READ_FLASH:
    return Direction::IN;
  case Command::SET_BOOT_TIME:
  case Command::STREAM_START:
  case Command::STREAM_STOP:
  case Command::I2C_READ_BYTES:
  case Command::I2C_WRITE_BYTES:
  case Command::I2C_SET_BIT_RATE:
  case Command::I2C_SET_RETRY_COUNT:
  case Command::CLEAR_FLASH_LOG:
    return Direction::OUT;
  }
  return std::nullopt;
}

std::optional<std::uint32_t> u32_arg(std::span<const std::uint8_t> data) {
  if (data.size() != 4) {
    return std::nullopt;
  }
  return range_cast<std::uint32_t>(data);
}
} // namespace

Firmware::Firmware(II2CBus &bus, std::string_view revision,
                   std::unique_ptr<FlashImage> flash)
    : m_state{revision},
      m_flash{flash ? std::move(flash) : std::make_unique<FlashImage>()},
      m_fault_log{*m_flash, m_state},
      m_executor{bus, m_state, m_fault_log, m_i2c_in},
      m_stream{m_executor, m_stream_in} {
  if (const auto st = m_executor.set_bit_rate(m_state.i2c_bit_rate);
      st != BusStatus::OK) {
    Log::error("bus init failed: {}", bus_status_str(st));
  }
}

bool Firmware::handle_control(IUsbDevice::Setup const &setup,
                              std::span<std::uint8_t> data) {
  std::lock_guard lock{m_control_mutex};
  const auto dir = command_direction(setup.request);
  if (!dir || *dir != setup.dir) {
    Log::debug("stall: request 0x{:02x}", setup.request);
    return false;
  }
  const auto cmd = static_cast<Command>(setup.request);
  switch (cmd) {
  case Command::READ_FLASH:
    return read_flash(setup, data);
  case Command::CLEAR_FLASH_LOG:
    return m_fault_log.clear();
  case Command::GET_FIRMWARE_INFO:
    return firmware_info(data);
  case Command::SET_BOOT_TIME:
    if (const auto ts = u32_arg(data)) {
      m_state.boot_timestamp = *ts;
      return true;
    }
    return false;
  case Command::I2C_READ_BYTES:
  case Command::I2C_WRITE_BYTES:
  case Command::I2C_SET_BIT_RATE:
    return bus_transaction(cmd, data);
  case Command::I2C_SET_RETRY_COUNT:
    if (const auto n = u32_arg(data)) {
      m_state.i2c_retry_count = std::min(*n, I2C::MAX_RETRY_COUNT);
      return true;
    }
    return false;
  case Command::GET_TRANSACTION_STATUS:
    if (data.size() != 4) {
      return false;
    }
    std::ranges::copy(le_bytes(m_state.last_status.load()), data.begin());
    return true;
  case Command::STREAM_START:
    return start_stream(data);
  case Command::STREAM_STOP:
    m_stream.stop();
    return true;
  }
  return false;
}

BulkChannel &Firmware::endpoint(IUsbDevice::BulkEndpoint ep) noexcept {
  return ep == IUsbDevice::BulkEndpoint::I2C_IN ? m_i2c_in : m_stream_in;
}

void Firmware::reset() {
  std::lock_guard lock{m_control_mutex};
  m_stream.stop();
  m_i2c_in.clear();
  m_state.last_status = 0;
}

bool Firmware::read_flash(IUsbDevice::Setup const &setup,
                          std::span<std::uint8_t> data) {
  const auto addr = static_cast<std::uint32_t>(setup.value) |
                    static_cast<std::uint32_t>(setup.index) << 16;
  if (data.size() > Flash::MAX_TRANSFER) {
    return false;
  }
  return m_flash->read(addr, data);
}

bool Firmware::firmware_info(std::span<std::uint8_t> data) {
  if (data.size() != Usb::FIRMWARE_INFO_SIZE) {
    return false;
  }
  const auto ts = le_bytes(m_state.boot_timestamp.load());
  auto it = std::ranges::copy(m_state.revision, data.begin()).out;
  std::ranges::copy(ts, it);
  return true;
}

bool Firmware::bus_transaction(Command cmd,
                               std::span<const std::uint8_t> data) {
  if (m_stream.active()) {
    Log::error("{} refused, stream active", command_to_string(cmd));
    set_status(BusStatus::BUSY);
    return true;
  }
  switch (cmd) {
  case Command::I2C_READ_BYTES:
    set_status(m_executor.handle_read(data));
    return true;
  case Command::I2C_WRITE_BYTES:
    set_status(m_executor.handle_write(data));
    return true;
  case Command::I2C_SET_BIT_RATE:
    if (const auto rate = u32_arg(data)) {
      set_status(m_executor.set_bit_rate(*rate));
      return true;
    }
    return false;
  default:
    return false;
  }
}

bool Firmware::start_stream(std::span<const std::uint8_t> data) {
  auto req = decode_stream_request(data);
  if (!req) {
    Log::error("stream start rejected: {}", req.status().to_string());
    return false;
  }
  return m_stream.arm(std::move(*req));
}

void Firmware::set_status(BusStatus st) noexcept {
  m_state.last_status = to_underlying(st);
}
