// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Connection.hpp>
#include <Log.hpp>
#include <utils.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <thread>

#include <fmt/format.h>

using Direction = ControlEndpoint::Direction;

namespace {
constexpr std::string_view open_status_str(IUsbDevice::OpenStatus st) {
  switch (st) {
  case IUsbDevice::OpenStatus::OK:
    return "OK";
  case IUsbDevice::OpenStatus::NOT_FOUND:
    return "not found";
  case IUsbDevice::OpenStatus::BUSY:
    return "busy";
  }
  return "unknown";
}
} // namespace

Connection::Connection(IUsbDevice::Ptr dev, LinkConfig const &cfg)
    : m_cfg{cfg}, m_ep{std::move(dev)}, m_flash{m_ep},
      m_error_log{m_flash}, m_i2c{m_ep, m_ctx},
      m_stream{m_ep, m_ctx, cfg.stream_poll} {}

Connection::~Connection() {
  if (const auto state = m_stream.state();
      state == StreamState::ARMED || state == StreamState::STREAMING) {
    if (auto st = m_stream.stop(); !st) {
      Log::error("failed to stop stream on close: {}", st.to_string());
    }
  }
  m_ep.device().close();
}

auto Connection::open(IUsbDevice::Ptr dev, LinkConfig const &cfg)
    -> Result<Ptr> {
  if (!dev) {
    return Status::Error(Err::NO_DEVICE, "no USB backend available");
  }
  for (unsigned attempt = 1; attempt <= cfg.connect_attempts; ++attempt) {
    const auto st = dev->open();
    if (st == IUsbDevice::OpenStatus::OK) {
      Log::info("connected to {:04x}:{:04x} on attempt {}", cfg.usb_id.vid,
                cfg.usb_id.pid, attempt);
      Ptr conn(new Connection(dev, cfg));
      if (auto init = conn->initialize(); !init) {
        return init;
      }
      return conn;
    }
    Log::info("connect attempt {}/{} failed: {}", attempt,
              cfg.connect_attempts, open_status_str(st));
    if (st == IUsbDevice::OpenStatus::BUSY) {
      dev->reset();
    }
    if (attempt < cfg.connect_attempts) {
      std::this_thread::sleep_for(cfg.reconnect_wait);
    }
  }
  return Status::Error(
      Err::NO_DEVICE,
      fmt::format("bridge {:04x}:{:04x} not available after {} attempts",
                  cfg.usb_id.vid, cfg.usb_id.pid, cfg.connect_attempts),
      cfg.connect_attempts);
}

Status Connection::initialize() {
  if (auto st = send_boot_time(); !st) {
    return st;
  }
  if (auto st = read_firmware_info(); !st) {
    return st;
  }
  if (auto st = m_i2c.set_bit_rate(m_cfg.i2c_bit_rate); !st) {
    return st;
  }
  return m_i2c.set_retry_count(m_cfg.i2c_retry_count);
}

Status Connection::send_boot_time() {
  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch());
  auto buf = le_bytes(static_cast<std::uint32_t>(now.count()));
  return m_ep.transfer(Command::SET_BOOT_TIME, Direction::OUT, buf,
                       Timeouts::COMMAND);
}

Status Connection::read_firmware_info() {
  std::array<std::uint8_t, Usb::FIRMWARE_INFO_SIZE> buf{};
  if (auto st = m_ep.transfer(Command::GET_FIRMWARE_INFO, Direction::IN, buf,
                              Timeouts::COMMAND);
      !st) {
    return st;
  }
  const auto rev = std::span{buf}.first(Usb::FIRMWARE_REV_SIZE);
  m_ctx.firmware_revision.assign(
      rev.begin(), std::find(rev.begin(), rev.end(), std::uint8_t{0}));
  m_ctx.boot_timestamp =
      range_cast<std::uint32_t>(std::span{buf}.subspan(Usb::FIRMWARE_REV_SIZE));
  Log::info("bridge firmware {}, boot time {}", m_ctx.firmware_revision,
            m_ctx.boot_timestamp);
  return Status::Ok();
}
