// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <I2CInterface.hpp>
#include <Log.hpp>
#include <Timeouts.hpp>
#include <utils.hpp>

#include <algorithm>
#include <array>

#include <fmt/format.h>

using Direction = ControlEndpoint::Direction;

auto I2CInterface::read(Preamble const &preamble, std::uint32_t num_bytes,
                        std::uint32_t timeout_ms)
    -> Result<std::vector<std::uint8_t>> {
  if (auto st = ensure_bus_free("I2C read"); !st) {
    return st;
  }
  auto payload = encode_read(preamble, num_bytes, timeout_ms);
  if (!payload) {
    return payload.status();
  }
  const auto timeout = usb_timeout(timeout_ms);
  if (auto st = m_ep.transfer(Command::I2C_READ_BYTES, Direction::OUT,
                              *payload, timeout);
      !st) {
    return st;
  }
  if (auto st = transaction_status("I2C read"); !st) {
    return st;
  }
  auto data = m_ep.bulk_read(ControlEndpoint::BulkEndpoint::I2C_IN, num_bytes,
                             timeout);
  if (!data) {
    return data.status();
  }
  if (!data->has_value()) {
    return Status::Error(Err::COMMUNICATION,
                         "no data on the I2C bulk endpoint after read");
  }
  if ((*data)->size() != num_bytes) {
    return Status::Error(Err::LAYOUT_MISMATCH,
                         fmt::format("I2C read returned {} bytes, expected {}",
                                     (*data)->size(), num_bytes),
                         static_cast<std::int64_t>((*data)->size()));
  }
  return std::move(**data);
}

Status I2CInterface::write(Preamble const &preamble,
                           std::span<const std::uint8_t> data,
                           std::uint32_t timeout_ms) {
  if (auto st = ensure_bus_free("I2C write"); !st) {
    return st;
  }
  auto payload = encode_write(preamble, data, timeout_ms);
  if (!payload) {
    return payload.status();
  }
  if (auto st = m_ep.transfer(Command::I2C_WRITE_BYTES, Direction::OUT,
                              *payload, usb_timeout(timeout_ms));
      !st) {
    return st;
  }
  return transaction_status("I2C write");
}

Status I2CInterface::set_bit_rate(std::uint32_t bit_rate) {
  if (auto st = ensure_bus_free("I2C bit rate change"); !st) {
    return st;
  }
  if (auto st = send_u32(Command::I2C_SET_BIT_RATE, bit_rate); !st) {
    return st;
  }
  if (auto st = transaction_status("I2C bit rate change"); !st) {
    return st;
  }
  m_ctx.i2c_bit_rate = std::clamp(bit_rate, I2C::MIN_BIT_RATE, I2C::MAX_BIT_RATE);
  Log::info("I2C bit rate set to {} bps", m_ctx.i2c_bit_rate);
  return Status::Ok();
}

Status I2CInterface::set_retry_count(std::uint32_t retry_count) {
  if (retry_count > I2C::MAX_RETRY_COUNT) {
    return Status::Error(Err::CONFIGURATION,
                         fmt::format("retry count {} exceeds the maximum of {}",
                                     retry_count, I2C::MAX_RETRY_COUNT),
                         retry_count);
  }
  if (auto st = ensure_bus_free("I2C retry count change"); !st) {
    return st;
  }
  if (auto st = send_u32(Command::I2C_SET_RETRY_COUNT, retry_count); !st) {
    return st;
  }
  m_ctx.i2c_retry_count = retry_count;
  return Status::Ok();
}

Status I2CInterface::ensure_bus_free(std::string_view op) const {
  if (m_ctx.stream_active) {
    return Status::Error(Err::INVALID_STATE,
                         fmt::format("{} not allowed while a stream is active",
                                     op));
  }
  return Status::Ok();
}

Status I2CInterface::send_u32(Command cmd, std::uint32_t val) {
  auto buf = le_bytes(val);
  return m_ep.transfer(cmd, Direction::OUT, buf, Timeouts::COMMAND);
}

Status I2CInterface::transaction_status(std::string_view op) {
  std::array<std::uint8_t, 4> buf{};
  if (auto st = m_ep.transfer(Command::GET_TRANSACTION_STATUS, Direction::IN,
                              buf, Timeouts::COMMAND);
      !st) {
    return st;
  }
  const auto code = range_cast<std::uint32_t>(buf);
  if (code != 0) {
    Log::error("{} failed on the device, status 0x{:x}", op, code);
    return Status::Error(Err::DEVICE_FAULT,
                         fmt::format("{} failed on the device", op), code);
  }
  return Status::Ok();
}

std::chrono::milliseconds
I2CInterface::usb_timeout(std::uint32_t bus_timeout_ms) const {
  return Timeouts::I2C_TRANSFER +
         std::chrono::milliseconds{bus_timeout_ms} * (m_ctx.i2c_retry_count + 1);
}
