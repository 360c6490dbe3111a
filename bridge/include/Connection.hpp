// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BufferedStream.hpp>
#include <ControlEndpoint.hpp>
#include <ErrorLog.hpp>
#include <FlashAccess.hpp>
#include <I2CInterface.hpp>
#include <IUsbDevice.hpp>
#include <LinkConfig.hpp>
#include <Status.hpp>

#include <memory>

// An opened and initialized bridge board. Owns the board state for the
// lifetime of the session.
class Connection {
public:
  using Ptr = std::unique_ptr<Connection>;

  // Tries cfg.connect_attempts times, resetting a busy board in between
  static Result<Ptr> open(IUsbDevice::Ptr dev, LinkConfig const &cfg = {});

  ~Connection();
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  FlashAccess &flash() noexcept { return m_flash; }
  ErrorLogStore &error_log() noexcept { return m_error_log; }
  I2CInterface &i2c() noexcept { return m_i2c; }
  BufferedStream &stream() noexcept { return m_stream; }
  ControlEndpoint &endpoint() noexcept { return m_ep; }
  LinkContext const &context() const noexcept { return m_ctx; }

private:
  Connection(IUsbDevice::Ptr dev, LinkConfig const &cfg);

  Status initialize();
  Status send_boot_time();
  Status read_firmware_info();

  LinkConfig m_cfg;
  ControlEndpoint m_ep;
  LinkContext m_ctx;
  FlashAccess m_flash;
  ErrorLogStore m_error_log;
  I2CInterface m_i2c;
  BufferedStream m_stream;
};
