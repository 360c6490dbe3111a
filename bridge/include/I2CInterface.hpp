// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BusTransaction.hpp>
#include <ControlEndpoint.hpp>
#include <LinkConfig.hpp>
#include <Status.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

// Host side of the I2C bus transaction protocol. Every transaction is one
// control OUT carrying the encoded payload followed by a status readback;
// reads then collect the captured bytes from the I2C bulk endpoint.
class I2CInterface {
public:
  I2CInterface(ControlEndpoint &ep, LinkContext &ctx) : m_ep{ep}, m_ctx{ctx} {}

  Result<std::vector<std::uint8_t>> read(Preamble const &preamble,
                                         std::uint32_t num_bytes,
                                         std::uint32_t timeout_ms);

  Status write(Preamble const &preamble, std::span<const std::uint8_t> data,
               std::uint32_t timeout_ms);

  // The device clamps the rate into [I2C::MIN_BIT_RATE, I2C::MAX_BIT_RATE]
  Status set_bit_rate(std::uint32_t bit_rate);

  Status set_retry_count(std::uint32_t retry_count);

private:
  Status ensure_bus_free(std::string_view op) const;
  Status send_u32(Command cmd, std::uint32_t val);
  Status transaction_status(std::string_view op);
  std::chrono::milliseconds usb_timeout(std::uint32_t bus_timeout_ms) const;

  ControlEndpoint &m_ep;
  LinkContext &m_ctx;
};
